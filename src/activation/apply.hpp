#ifndef POLYVIEW_ACTIVATION_APPLY_HPP
#define POLYVIEW_ACTIVATION_APPLY_HPP

#include <torch/torch.h>

#include <utility>

#include "activation.hpp"

namespace Polyview::Activation::Details {
    inline torch::Tensor apply(::Polyview::Activation::Type type, torch::Tensor input) {
        switch (type) {
            case ::Polyview::Activation::Type::ReLU:
                return torch::relu(std::move(input));
            case ::Polyview::Activation::Type::LeakyReLU:
                return torch::leaky_relu(std::move(input));
            case ::Polyview::Activation::Type::Tanh:
                return torch::tanh(std::move(input));
            case ::Polyview::Activation::Type::Sigmoid:
                return torch::sigmoid(std::move(input));
            case ::Polyview::Activation::Type::SiLU:
                return torch::silu(std::move(input));
            case ::Polyview::Activation::Type::GeLU:
                return torch::gelu(std::move(input));
            case ::Polyview::Activation::Type::Identity:
            default:
                return input;
        }
    }
}
#endif // POLYVIEW_ACTIVATION_APPLY_HPP
