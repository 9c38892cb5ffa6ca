#ifndef POLYVIEW_SGD_HPP
#define POLYVIEW_SGD_HPP

#include <stdexcept>
#include <string_view>

#include <torch/torch.h>

#include "adam.hpp"

namespace Polyview::Optimizer::Details {

    struct SGDOptions {
        double learning_rate{1e-2};
        double momentum{0.0};
        double dampening{0.0};
        double weight_decay{0.0};
        bool nesterov{false};
    };

    struct SGDDescriptor {
        SGDOptions options{};
    };

    inline torch::optim::SGDOptions to_torch_options(const SGDOptions& options) {
        detail::check_rate("SGD", options.learning_rate, options.weight_decay);
        if (options.nesterov && (options.momentum <= 0.0 || options.dampening != 0.0)) {
            throw std::invalid_argument("Nesterov momentum requires a positive momentum and zero dampening.");
        }
        return torch::optim::SGDOptions(options.learning_rate)
            .momentum(options.momentum)
            .dampening(options.dampening)
            .weight_decay(options.weight_decay)
            .nesterov(options.nesterov);
    }

    [[nodiscard]] constexpr std::string_view name(const SGDDescriptor&) noexcept { return "SGD"; }
}

#endif // POLYVIEW_SGD_HPP
