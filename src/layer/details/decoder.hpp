#ifndef POLYVIEW_LAYER_DECODER_HPP
#define POLYVIEW_LAYER_DECODER_HPP

#include <algorithm>
#include <cstdint>
#include <functional>
#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../../distribution/details/normal.hpp"
#include "encoder.hpp"
#include "mlp.hpp"

namespace Polyview::Layer::Details {

    struct DecoderOptions {
        std::int64_t z_dim{};
        std::vector<std::int64_t> hidden_layer_dims{}; // encoder order; reversed internally
        std::int64_t output_dim{};
        ::Polyview::Activation::Descriptor activation{::Polyview::Activation::Identity};
        ::Polyview::Initialization::Descriptor initialization{::Polyview::Initialization::Default};
        double logvar_init_std{0.01};
    };

    // z [batch, z_dim] -> p(x | z) over [batch, output_dim].
    class DecoderModule : public torch::nn::Module {
    public:
        virtual ::Polyview::Distribution::Details::Normal forward(const torch::Tensor& z) = 0;
        [[nodiscard]] virtual std::int64_t z_dim() const = 0;
        [[nodiscard]] virtual std::int64_t output_dim() const = 0;
    };

    using DecoderFactory = std::function<std::shared_ptr<DecoderModule>(const DecoderOptions&)>;

    // Gaussian likelihood: loc from the MLP, one learned log-variance per feature.
    class MLPDecoderImpl : public DecoderModule {
    public:
        explicit MLPDecoderImpl(const DecoderOptions& options)
            : z_dim_(options.z_dim), output_dim_(options.output_dim)
        {
            if (options.output_dim <= 0) {
                throw std::invalid_argument("Decoder requires a positive output_dim.");
            }
            auto hidden = options.hidden_layer_dims;
            std::reverse(hidden.begin(), hidden.end());
            body_ = register_module("body", MLP(MLPOptions{
                .widths = widths_of(options.z_dim, hidden),
                .activation = options.activation,
                .initialization = options.initialization}));
            loc_head_ = register_module("loc", torch::nn::Linear(body_->output_width(), output_dim_));
            ::Polyview::Initialization::Details::apply_linear_initialization(loc_head_, options.initialization);
            logvar_out_ = register_parameter("logvar_out",
                                             torch::empty({1, output_dim_}).normal_(0.0, options.logvar_init_std));
        }

        ::Polyview::Distribution::Details::Normal forward(const torch::Tensor& z) override {
            check_view_input(z, z_dim_, "Decoder");
            auto loc = loc_head_(body_->forward(z));
            return ::Polyview::Distribution::Details::Normal(std::move(loc), logvar_out_);
        }

        [[nodiscard]] std::int64_t z_dim() const override { return z_dim_; }
        [[nodiscard]] std::int64_t output_dim() const override { return output_dim_; }

    private:
        std::int64_t z_dim_{};
        std::int64_t output_dim_{};
        MLP body_{nullptr};
        torch::nn::Linear loc_head_{nullptr};
        torch::Tensor logvar_out_{};
    };

    [[nodiscard]] inline std::shared_ptr<DecoderModule> make_mlp_decoder(const DecoderOptions& options) {
        return std::make_shared<MLPDecoderImpl>(options);
    }
}

#endif // POLYVIEW_LAYER_DECODER_HPP
