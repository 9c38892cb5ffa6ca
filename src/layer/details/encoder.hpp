#ifndef POLYVIEW_LAYER_ENCODER_HPP
#define POLYVIEW_LAYER_ENCODER_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../../distribution/details/kl.hpp"
#include "../../sparsity/details/gate.hpp"
#include "mlp.hpp"

namespace Polyview::Layer::Details {

    struct EncoderOptions {
        std::int64_t input_dim{};
        std::vector<std::int64_t> hidden_layer_dims{};
        std::int64_t z_dim{};
        ::Polyview::Activation::Descriptor activation{::Polyview::Activation::Identity};
        ::Polyview::Initialization::Descriptor initialization{::Polyview::Initialization::Default};
    };

    // Column block [offset, offset + z_dim) of the owning model's gate. The gate is
    // borrowed, never registered, so its parameter is listed once on the model.
    struct GateSlice {
        ::Polyview::Sparsity::Gate gate{nullptr};
        std::int64_t offset{0};

        [[nodiscard]] bool sparse() const noexcept { return !gate.is_empty(); }
    };

    // x [batch, input_dim] -> (mu, logvar), both [batch, z_dim].
    class EncoderModule : public torch::nn::Module {
    public:
        virtual std::pair<torch::Tensor, torch::Tensor> forward(const torch::Tensor& x) = 0;
        [[nodiscard]] virtual std::int64_t input_dim() const = 0;
        [[nodiscard]] virtual std::int64_t z_dim() const = 0;
    };

    using EncoderFactory = std::function<std::shared_ptr<EncoderModule>(const EncoderOptions&, const GateSlice&)>;

    inline void check_view_input(const torch::Tensor& x, std::int64_t input_dim, const char* who) {
        if (!x.defined() || x.dim() != 2 || x.size(1) != input_dim) {
            std::ostringstream message;
            message << who << " expects input of shape [batch, " << input_dim << "], got ";
            if (x.defined()) {
                message << x.sizes();
            } else {
                message << "an undefined tensor";
            }
            message << '.';
            throw std::invalid_argument(message.str());
        }
    }

    /*
     * Default variational encoder.
     *  - body: input -> hidden... with the configured activation after each layer.
     *  - dense: separate mu and logvar heads.
     *  - sparse: no logvar head; logvar = log_alpha + log(mu^2 + 1e-8), so the
     *    gate alone sets the dropout rate of each latent dimension.
     */
    class MLPEncoderImpl : public EncoderModule {
    public:
        MLPEncoderImpl(const EncoderOptions& options, GateSlice gate)
            : input_dim_(options.input_dim), z_dim_(options.z_dim), gate_(std::move(gate))
        {
            if (options.z_dim <= 0) {
                throw std::invalid_argument("Encoder requires a positive z_dim.");
            }
            body_ = register_module("body", MLP(MLPOptions{
                .widths = widths_of(options.input_dim, options.hidden_layer_dims),
                .activation = options.activation,
                .initialization = options.initialization}));

            const auto width = body_->output_width();
            mu_head_ = register_module("mu", torch::nn::Linear(width, z_dim_));
            ::Polyview::Initialization::Details::apply_linear_initialization(mu_head_, options.initialization);
            if (gate_.sparse()) {
                if (gate_.offset < 0 || gate_.offset + z_dim_ > gate_.gate->width()) {
                    std::ostringstream message;
                    message << "Encoder gate columns [" << gate_.offset << ", " << gate_.offset + z_dim_
                            << ") exceed the gate width " << gate_.gate->width() << '.';
                    throw std::out_of_range(message.str());
                }
            } else {
                logvar_head_ = register_module("logvar", torch::nn::Linear(width, z_dim_));
                ::Polyview::Initialization::Details::apply_linear_initialization(logvar_head_, options.initialization);
            }
        }

        std::pair<torch::Tensor, torch::Tensor> forward(const torch::Tensor& x) override {
            check_view_input(x, input_dim_, "Encoder");
            auto hidden = body_->forward(x);
            auto mu = mu_head_(hidden);
            if (gate_.sparse()) {
                auto log_alpha = gate_.gate->slice(gate_.offset, z_dim_);
                auto logvar = ::Polyview::Distribution::Details::logvar_from(mu, log_alpha);
                return {std::move(mu), std::move(logvar)};
            }
            return {std::move(mu), logvar_head_(hidden)};
        }

        [[nodiscard]] std::int64_t input_dim() const override { return input_dim_; }
        [[nodiscard]] std::int64_t z_dim() const override { return z_dim_; }

    private:
        std::int64_t input_dim_{};
        std::int64_t z_dim_{};
        GateSlice gate_{};
        MLP body_{nullptr};
        torch::nn::Linear mu_head_{nullptr};
        torch::nn::Linear logvar_head_{nullptr};
    };

    [[nodiscard]] inline std::shared_ptr<EncoderModule> make_mlp_encoder(const EncoderOptions& options, const GateSlice& gate) {
        return std::make_shared<MLPEncoderImpl>(options, gate);
    }
}

#endif // POLYVIEW_LAYER_ENCODER_HPP
