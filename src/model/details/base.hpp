#ifndef POLYVIEW_MODEL_BASE_HPP
#define POLYVIEW_MODEL_BASE_HPP
/*
 * Shared machinery of every multi-view model.
 * ---------------------------------------------------------------------------
 * Responsibilities:
 *  - Validate ModelOptions once and own the sparsity gate (when threshold != 0).
 *  - Build encoders / decoders through the configured factories so the
 *    networks stay black boxes behind Layer::EncoderModule / DecoderModule.
 *  - Run the fixed pipeline encode -> sample -> decode and assemble
 *    total = beta * kl - ll from the posteriors and likelihoods it produced.
 *  - Delegate optimizer construction to an Optimizer::Partition fixed at the
 *    end of construction (finalize()), checked to cover every trainable
 *    parameter exactly once.
 *
 * Variants provide encode(), decode(), the sampling rule and the partition.
 */

#include <cstddef>
#include <cstdint>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../../common/config.hpp"
#include "../../common/options.hpp"
#include "../../distribution/distribution.hpp"
#include "../../layer/layer.hpp"
#include "../../loss/loss.hpp"
#include "../../optimizer/optimizer.hpp"
#include "../../sparsity/sparsity.hpp"
#include "../../utils/terminal.hpp"
#include "output.hpp"

namespace Polyview::Model::Details {

    using Views = std::vector<torch::Tensor>;
    using OptimizerList = std::vector<std::unique_ptr<torch::optim::Optimizer>>;

    class ModelBase : public torch::nn::Module {
    public:
        ~ModelBase() override = default;

        // ---------- Forward / loss contract ----------
        ForwardOutput forward(const Views& x) {
            check_views(x);
            ForwardOutput output{};
            output.qz_x = encode(x);
            output.z.reserve(output.qz_x.size());
            for (const auto& qz_x : output.qz_x) {
                output.z.push_back(sample(qz_x));
            }
            output.px_zs = decode(output.z);
            return output;
        }

        virtual Loss::Terms loss_function(const Views& x, const ForwardOutput& output) {
            check_views(x);
            return Loss::assemble(calc_kl(output.qz_x), calc_ll(x, output.px_zs), options_.beta);
        }

        virtual std::vector<Distribution::Normal> encode(const Views& x) = 0;
        virtual std::vector<std::vector<Distribution::Normal>> decode(const std::vector<torch::Tensor>& z) = 0;

        // ---------- Optimizer contract ----------
        [[nodiscard]] OptimizerList configure_optimizers() const {
            if (partition_.empty()) {
                throw std::logic_error("configure_optimizers called before the model finished construction.");
            }
            return partition_.build(optimizer_descriptor());
        }

        [[nodiscard]] const Optimizer::Partition& partition() const noexcept { return partition_; }

        [[nodiscard]] Optimizer::Descriptor optimizer_descriptor() const {
            if (options_.optimizer) {
                return *options_.optimizer;
            }
            return Optimizer::Adam({.learning_rate = options_.learning_rate});
        }

        // ---------- Sparsity ----------
        [[nodiscard]] bool sparse() const noexcept { return !gate_.is_empty(); }
        [[nodiscard]] double threshold() const noexcept { return options_.threshold; }

        void set_threshold(double threshold) {
            if (!sparse()) {
                throw std::logic_error("Sparsity was disabled at construction (threshold == 0) and cannot be enabled later.");
            }
            Sparsity::check_threshold(threshold);
            options_.threshold = threshold;
        }

        [[nodiscard]] const torch::Tensor& log_alpha() const {
            require_sparse("log_alpha");
            return gate_->log_alpha();
        }

        // Per-dimension probability that the latent dimension is noise.
        [[nodiscard]] torch::Tensor dropout() const {
            require_sparse("dropout");
            return Sparsity::dropout_rate(gate_->log_alpha());
        }

        [[nodiscard]] torch::Tensor apply_threshold(const torch::Tensor& z) const {
            require_sparse("apply_threshold");
            return Sparsity::apply_threshold(z, gate_->log_alpha(), options_.threshold);
        }

        [[nodiscard]] std::vector<torch::Tensor> apply_threshold(const std::vector<torch::Tensor>& z) const {
            require_sparse("apply_threshold");
            return Sparsity::apply_threshold(z, gate_->log_alpha(), options_.threshold);
        }

        // ---------- Inference ----------
        // Posterior means, pruned by the gate on sparse models.
        [[nodiscard]] std::vector<torch::Tensor> predict_latents(const Views& x) {
            check_views(x);
            torch::NoGradGuard no_grad;
            const EvalScope scope(*this);
            std::vector<torch::Tensor> latents;
            for (const auto& qz_x : encode(x)) {
                latents.push_back(qz_x.mean());
            }
            return sparse() ? apply_threshold(latents) : latents;
        }

        [[nodiscard]] std::vector<std::vector<torch::Tensor>> predict_reconstructions(const Views& x) {
            auto latents = predict_latents(x);
            torch::NoGradGuard no_grad;
            const EvalScope scope(*this);
            ForwardOutput output{};
            output.px_zs = decode(latents);
            return output.reconstructions();
        }

        // Squared error of every decoder mean against its target view.
        [[nodiscard]] torch::Tensor reconstruction_error(const Views& x, const ForwardOutput& output) const {
            check_views(x);
            check_output_rows(output.px_zs);
            auto total = torch::zeros({}, x.front().options());
            for (std::size_t view = 0; view < output.px_zs.size(); ++view) {
                for (const auto& px_z : output.px_zs[view]) {
                    total = total + Loss::reconstruction_error(x[view], px_z.mean());
                }
            }
            return total;
        }

        // ---------- Introspection ----------
        [[nodiscard]] virtual std::string model_type() const = 0;
        [[nodiscard]] const ModelOptions& options() const noexcept { return options_; }
        [[nodiscard]] std::size_t n_views() const noexcept { return options_.input_dims.size(); }
        [[nodiscard]] const std::vector<std::int64_t>& input_dims() const noexcept { return options_.input_dims; }
        [[nodiscard]] double beta() const noexcept { return options_.beta; }
        // Width of the latent fed to decoders (post-concatenation for disentangled models).
        [[nodiscard]] std::int64_t z_dim() const noexcept { return z_dim_; }

        [[nodiscard]] std::string summary() const {
            std::ostringstream stream;
            for (const auto& [key, value] : summary_rows()) {
                stream << key << ": " << value << '\n';
            }
            return stream.str();
        }

    protected:
        explicit ModelBase(ModelOptions options) : options_(std::move(options))
        {
            Config::validate(options_);
            z_dim_ = options_.z_dim;
            if (!options_.encoder_factory) {
                options_.encoder_factory = Layer::DefaultEncoder();
            }
            if (!options_.decoder_factory) {
                options_.decoder_factory = Layer::DefaultDecoder();
            }
        }

        // RAII switch to eval mode for inference helpers.
        class EvalScope {
        public:
            explicit EvalScope(torch::nn::Module& module) : module_(module), was_training_(module.is_training()) {
                module_.eval();
            }
            ~EvalScope() { module_.train(was_training_); }
            EvalScope(const EvalScope&) = delete;
            EvalScope& operator=(const EvalScope&) = delete;

        private:
            torch::nn::Module& module_;
            bool was_training_;
        };

        // Call from the derived constructor once every module is registered.
        void finalize() {
            Optimizer::Partition partition = build_partition();
            if (sparse()) {
                partition.add("gate", {gate_->log_alpha()});
            }
            partition.verify_covers(parameters());
            partition_ = std::move(partition);

            if (options_.logging.monitor) {
                Utils::Terminal::PrintFrame(*options_.logging.stream, model_type(), summary_rows(),
                                            Utils::Terminal::Colors::kBrightBlue);
            }
        }

        virtual Optimizer::Partition build_partition() const = 0;
        virtual torch::Tensor sample(const Distribution::Normal& qz_x) const = 0;

        // Sum of batch-averaged KL terms, unweighted.
        virtual torch::Tensor calc_kl(const std::vector<Distribution::Normal>& qz_x) const {
            if (qz_x.empty()) {
                throw std::invalid_argument("calc_kl requires at least one posterior.");
            }
            auto kl = torch::zeros({}, qz_x.front().loc().options());
            for (const auto& posterior : qz_x) {
                const auto elementwise = sparse() ? posterior.sparse_kl_divergence()
                                                  : posterior.kl_divergence(Distribution::StandardNormal(posterior.loc()));
                kl = kl + Loss::reduce_elementwise(elementwise);
            }
            return kl;
        }

        // Sum over every (view, latent) likelihood of the batch-averaged log density.
        virtual torch::Tensor calc_ll(const Views& x, const std::vector<std::vector<Distribution::Normal>>& px_zs) const {
            check_output_rows(px_zs);
            auto ll = torch::zeros({}, x.front().options());
            for (std::size_t view = 0; view < px_zs.size(); ++view) {
                for (const auto& px_z : px_zs[view]) {
                    ll = ll + Loss::reduce_elementwise(px_z.log_likelihood(x[view]));
                }
            }
            return ll;
        }

        void create_gate(std::int64_t width) {
            if (!Sparsity::enabled(options_.threshold)) {
                return;
            }
            gate_ = register_module("gate", Sparsity::Gate(Sparsity::GateOptions{.width = width}));
        }

        [[nodiscard]] Layer::GateSlice gate_slice(std::int64_t offset) const {
            if (!sparse()) {
                return {};
            }
            return Layer::GateSlice{.gate = gate_, .offset = offset};
        }

        [[nodiscard]] Layer::EncoderOptions encoder_options(std::int64_t input_dim, std::int64_t z_dim) const {
            return Layer::EncoderOptions{
                .input_dim = input_dim,
                .hidden_layer_dims = options_.hidden_layer_dims,
                .z_dim = z_dim,
                .activation = layer_activation(),
                .initialization = options_.initialization};
        }

        [[nodiscard]] Layer::DecoderOptions decoder_options(std::int64_t output_dim) const {
            return Layer::DecoderOptions{
                .z_dim = z_dim_,
                .hidden_layer_dims = options_.hidden_layer_dims,
                .output_dim = output_dim,
                .activation = layer_activation(),
                .initialization = options_.initialization};
        }

        std::shared_ptr<Layer::EncoderModule> make_encoder(const std::string& name,
                                                           std::int64_t input_dim,
                                                           std::int64_t z_dim,
                                                           std::int64_t gate_offset) {
            auto encoder = options_.encoder_factory(encoder_options(input_dim, z_dim), gate_slice(gate_offset));
            if (!encoder || encoder->input_dim() != input_dim || encoder->z_dim() != z_dim) {
                throw std::logic_error("Encoder factory returned a module that does not match the requested shape for '" + name + "'.");
            }
            return register_module(name, std::move(encoder));
        }

        std::shared_ptr<Layer::DecoderModule> make_decoder(const std::string& name, std::int64_t output_dim) {
            auto decoder = options_.decoder_factory(decoder_options(output_dim));
            if (!decoder || decoder->z_dim() != z_dim_ || decoder->output_dim() != output_dim) {
                throw std::logic_error("Decoder factory returned a module that does not match the requested shape for '" + name + "'.");
            }
            return register_module(name, std::move(decoder));
        }

        void set_z_dim(std::int64_t z_dim) noexcept { z_dim_ = z_dim; }

        void check_views(const Views& x) const {
            if (x.size() != n_views()) {
                std::ostringstream message;
                message << "Model expects " << n_views() << " views but received " << x.size() << '.';
                throw std::invalid_argument(message.str());
            }
            for (std::size_t view = 0; view < x.size(); ++view) {
                const auto& tensor = x[view];
                if (!tensor.defined() || tensor.dim() != 2 || tensor.size(1) != options_.input_dims[view]
                    || tensor.size(0) != x.front().size(0)) {
                    std::ostringstream message;
                    message << "View " << view << " must have shape [batch, " << options_.input_dims[view]
                            << "] with the batch size of view 0, got ";
                    if (tensor.defined()) {
                        message << tensor.sizes();
                    } else {
                        message << "an undefined tensor";
                    }
                    message << '.';
                    throw std::invalid_argument(message.str());
                }
            }
        }

        void check_output_rows(const std::vector<std::vector<Distribution::Normal>>& px_zs) const {
            if (px_zs.size() != n_views()) {
                std::ostringstream message;
                message << "Forward output holds " << px_zs.size() << " reconstruction rows for " << n_views() << " views.";
                throw std::invalid_argument(message.str());
            }
        }

        [[nodiscard]] virtual std::vector<std::pair<std::string, std::string>> summary_rows() const {
            std::ostringstream dims;
            for (std::size_t index = 0; index < options_.input_dims.size(); ++index) {
                dims << (index ? ", " : "") << options_.input_dims[index];
            }
            std::size_t parameter_count = 0;
            for (const auto& parameter : parameters()) {
                parameter_count += static_cast<std::size_t>(parameter.numel());
            }

            std::vector<std::pair<std::string, std::string>> rows{
                {"views", std::to_string(n_views()) + " [" + dims.str() + "]"},
                {"latent width", std::to_string(z_dim_)},
                {"beta", std::to_string(options_.beta)},
                {"sparsity", sparse() ? "threshold " + std::to_string(options_.threshold) : std::string("off")},
                {"activation", std::string(Activation::to_string(layer_activation().type))},
                {"parameters", std::to_string(parameter_count)},
            };
            if (!partition_.empty()) {
                rows.emplace_back("optimizers", std::to_string(partition_.optimizer_count()) + " x "
                                                  + std::string(Optimizer::name(optimizer_descriptor())) + " ("
                                                  + std::string(Optimizer::Details::to_string(partition_.mode())) + ")");
            }
            return rows;
        }

        [[nodiscard]] Activation::Descriptor layer_activation() const noexcept {
            return options_.non_linear ? options_.activation : Activation::Identity;
        }

        void require_sparse(const char* operation) const {
            if (!sparse()) {
                throw std::logic_error(std::string(operation) + " is unsupported for a non-sparse model.");
            }
        }

        ModelOptions options_{};
        Sparsity::Gate gate_{nullptr};

    private:
        std::int64_t z_dim_{};
        Optimizer::Partition partition_{};
    };
}

#endif // POLYVIEW_MODEL_BASE_HPP
