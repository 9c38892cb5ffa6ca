#ifndef POLYVIEW_COMMON_OPTIONS_HPP
#define POLYVIEW_COMMON_OPTIONS_HPP

#include <cstdint>
#include <iostream>
#include <optional>
#include <ostream>
#include <string_view>
#include <vector>

#include "../activation/activation.hpp"
#include "../fusion/fusion.hpp"
#include "../initialization/initialization.hpp"
#include "../layer/layer.hpp"
#include "../optimizer/optimizer.hpp"

namespace Polyview {
    struct LogOptions {
        bool monitor{false};
        std::ostream* stream{&std::cout};
    };

    // Input of the shared encoder in disentangled models.
    enum class SharedInput {
        FirstView, // view 0 only
        AllViews,  // feature-wise concatenation of every view
    };

    [[nodiscard]] constexpr std::string_view to_string(SharedInput input) noexcept {
        return input == SharedInput::AllViews ? "AllViews" : "FirstView";
    }

    /*
     * Construction options shared by every model variant.
     * ---------------------------------------------------------------------------
     *  - threshold == 0 disables sparsity for the lifetime of the model;
     *    any value in (0, 1] enables the variational dropout gate.
     *  - activation is applied between layers only when non_linear is set.
     *  - join_type is read by joint models, private_latent / shared_input by
     *    disentangled models, cross_reconstruction by independent models.
     *  - optimizer defaults to Adam at learning_rate.
     *  - encoder_factory / decoder_factory replace the default MLP networks.
     */
    struct ModelOptions {
        std::vector<std::int64_t> input_dims{};
        std::int64_t z_dim{1};
        std::vector<std::int64_t> hidden_layer_dims{};
        bool non_linear{false};
        Activation::Descriptor activation{Activation::ReLU};
        Initialization::Descriptor initialization{Initialization::Default};
        double learning_rate{0.002};
        double beta{1.0};
        double threshold{0.0};
        Fusion::JoinType join_type{Fusion::JoinType::Mean};
        bool private_latent{false};
        SharedInput shared_input{SharedInput::FirstView};
        bool cross_reconstruction{true};
        std::optional<Optimizer::Descriptor> optimizer{};
        Layer::EncoderFactory encoder_factory{};
        Layer::DecoderFactory decoder_factory{};
        LogOptions logging{};
    };
}

#endif // POLYVIEW_COMMON_OPTIONS_HPP
