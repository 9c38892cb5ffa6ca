#ifndef POLYVIEW_INITIALIZATION_APPLY_HPP
#define POLYVIEW_INITIALIZATION_APPLY_HPP
#include <torch/torch.h>

#include "initialization.hpp"

namespace Polyview::Initialization::Details {
    namespace detail {
        inline void zero_bias_if_present(const torch::nn::Linear& module) {
            if (module->bias.defined()) {
                torch::nn::init::zeros_(module->bias);
            }
        }
    }  // namespace detail

    // Weights are re-drawn under NoGradGuard; Default keeps libtorch's own init.
    inline void apply_linear_initialization(const torch::nn::Linear& module, ::Polyview::Initialization::Descriptor descriptor) {
        torch::NoGradGuard no_grad;
        switch (descriptor.type) {
            case ::Polyview::Initialization::Type::XavierNormal:
                torch::nn::init::xavier_normal_(module->weight);
                detail::zero_bias_if_present(module);
                break;
            case ::Polyview::Initialization::Type::XavierUniform:
                torch::nn::init::xavier_uniform_(module->weight);
                detail::zero_bias_if_present(module);
                break;
            case ::Polyview::Initialization::Type::KaimingNormal:
                torch::nn::init::kaiming_normal_(module->weight,
                                                 /*a=*/0.0,
                                                 torch::kFanIn,
                                                 torch::kReLU);
                detail::zero_bias_if_present(module);
                break;
            case ::Polyview::Initialization::Type::KaimingUniform:
                torch::nn::init::kaiming_uniform_(module->weight,
                                                  /*a=*/0.0,
                                                  torch::kFanIn,
                                                  torch::kReLU);
                detail::zero_bias_if_present(module);
                break;
            case ::Polyview::Initialization::Type::ZeroBias:
                detail::zero_bias_if_present(module);
                break;
            case ::Polyview::Initialization::Type::Default:
            default:
                break;
        }
    }
}
#endif // POLYVIEW_INITIALIZATION_APPLY_HPP
