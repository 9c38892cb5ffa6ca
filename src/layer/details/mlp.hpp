#ifndef POLYVIEW_LAYER_MLP_HPP
#define POLYVIEW_LAYER_MLP_HPP

#include <cstddef>
#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../../activation/activation.hpp"
#include "../../activation/apply.hpp"
#include "../../initialization/apply.hpp"
#include "../../initialization/initialization.hpp"

namespace Polyview::Layer::Details {

    struct MLPOptions {
        std::vector<std::int64_t> widths{}; // input, hidden..., output
        ::Polyview::Activation::Descriptor activation{::Polyview::Activation::Identity};
        ::Polyview::Initialization::Descriptor initialization{::Polyview::Initialization::Default};
    };

    // Stack of fully connected layers; the activation follows every layer.
    // A single width yields an identity stack.
    class MLPImpl : public torch::nn::Module {
    public:
        explicit MLPImpl(const MLPOptions& options) : activation_(options.activation)
        {
            if (options.widths.empty()) {
                throw std::invalid_argument("MLP requires at least an input width.");
            }
            for (const auto width : options.widths) {
                if (width <= 0) {
                    std::ostringstream message;
                    message << "MLP widths must be positive, got " << width << '.';
                    throw std::invalid_argument(message.str());
                }
            }

            for (std::size_t index = 0; index + 1 < options.widths.size(); ++index) {
                auto linear = register_module("fc_" + std::to_string(index),
                                              torch::nn::Linear(options.widths[index], options.widths[index + 1]));
                ::Polyview::Initialization::Details::apply_linear_initialization(linear, options.initialization);
                layers_.push_back(std::move(linear));
            }
            output_width_ = options.widths.back();
        }

        torch::Tensor forward(torch::Tensor input) {
            for (auto& layer : layers_) {
                input = ::Polyview::Activation::Details::apply(activation_.type, layer(input));
            }
            return input;
        }

        [[nodiscard]] std::int64_t output_width() const noexcept { return output_width_; }

    private:
        std::vector<torch::nn::Linear> layers_{};
        ::Polyview::Activation::Descriptor activation_{};
        std::int64_t output_width_{};
    };

    TORCH_MODULE(MLP);

    [[nodiscard]] inline std::vector<std::int64_t> widths_of(std::int64_t input, const std::vector<std::int64_t>& hidden) {
        std::vector<std::int64_t> widths;
        widths.reserve(hidden.size() + 1);
        widths.push_back(input);
        widths.insert(widths.end(), hidden.begin(), hidden.end());
        return widths;
    }
}

#endif // POLYVIEW_LAYER_MLP_HPP
