#ifndef POLYVIEW_OPTIMIZER_REGISTRY_HPP
#define POLYVIEW_OPTIMIZER_REGISTRY_HPP

#include <memory>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <torch/torch.h>

#include "details/adam.hpp"
#include "details/sgd.hpp"

namespace Polyview::Optimizer::Details {
    using Descriptor = std::variant<AdamDescriptor, AdamWDescriptor, SGDDescriptor>;

    // Params is either std::vector<torch::Tensor> or std::vector<torch::optim::OptimizerParamGroup>.
    template <class Params, class Unsupported>
    std::unique_ptr<torch::optim::Optimizer> build_optimizer(Params&&, const Unsupported&) {
        static_assert(sizeof(Unsupported) == 0, "Unsupported optimizer descriptor provided to build_optimizer.");
        return nullptr;
    }

    template <class Params>
    std::unique_ptr<torch::optim::Optimizer> build_optimizer(Params&& params, const AdamDescriptor& descriptor) {
        return std::make_unique<torch::optim::Adam>(std::forward<Params>(params), to_torch_options(descriptor.options));
    }

    template <class Params>
    std::unique_ptr<torch::optim::Optimizer> build_optimizer(Params&& params, const AdamWDescriptor& descriptor) {
        return std::make_unique<torch::optim::AdamW>(std::forward<Params>(params), to_torch_options(descriptor.options));
    }

    template <class Params>
    std::unique_ptr<torch::optim::Optimizer> build_optimizer(Params&& params, const SGDDescriptor& descriptor) {
        return std::make_unique<torch::optim::SGD>(std::forward<Params>(params), to_torch_options(descriptor.options));
    }

    template <class Params>
    std::unique_ptr<torch::optim::Optimizer> build_optimizer(Params&& params, const Descriptor& descriptor) {
        return std::visit(
            [&](const auto& concrete) { return build_optimizer(std::forward<Params>(params), concrete); },
            descriptor);
    }

    [[nodiscard]] inline std::string_view name(const Descriptor& descriptor) {
        return std::visit([](const auto& concrete) { return name(concrete); }, descriptor);
    }
}

#endif // POLYVIEW_OPTIMIZER_REGISTRY_HPP
