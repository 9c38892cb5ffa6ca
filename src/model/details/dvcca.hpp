#ifndef POLYVIEW_MODEL_DVCCA_HPP
#define POLYVIEW_MODEL_DVCCA_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <numeric>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "base.hpp"

namespace Polyview::Model::Details {

    /*
     * Deep variational CCA with optional private latents.
     * ---------------------------------------------------------------------------
     *  - A shared encoder reads view 0 (FirstView) or every view concatenated
     *    along features (AllViews).
     *  - private_latent adds one encoder per view; posterior i is the column
     *    concatenation [shared | private_i], so the latent fed to decoders is
     *    2 * z_dim wide. The gate spans that full width: the shared encoder
     *    reads columns [0, z_dim), private encoders read [z_dim, 2 * z_dim).
     *  - Samples are reparameterised in training mode and the posterior mean
     *    is used in eval mode.
     */
    class DVCCA : public ModelBase {
    public:
        explicit DVCCA(ModelOptions options) : ModelBase(std::move(options))
        {
            const auto base_width = options_.z_dim;
            const auto width = options_.private_latent ? base_width + base_width : base_width;
            create_gate(width);

            shared_encoder_ = make_encoder("shared_encoder", shared_input_dim(), base_width, 0);
            if (options_.private_latent) {
                for (std::size_t view = 0; view < n_views(); ++view) {
                    private_encoders_.push_back(
                        make_encoder("private_encoder_" + std::to_string(view), input_dims()[view], base_width, base_width));
                }
            }

            set_z_dim(width);
            for (std::size_t view = 0; view < n_views(); ++view) {
                decoders_.push_back(make_decoder("decoder_" + std::to_string(view), input_dims()[view]));
            }
            finalize();
        }

        std::vector<Distribution::Normal> encode(const Views& x) override {
            check_views(x);
            const auto shared_x = options_.shared_input == SharedInput::AllViews ? torch::cat(x, 1) : x.front();
            auto [mu, logvar] = shared_encoder_->forward(shared_x);
            if (!options_.private_latent) {
                return {Distribution::Gaussian(std::move(mu), std::move(logvar))};
            }

            std::vector<Distribution::Normal> posteriors;
            posteriors.reserve(private_encoders_.size());
            for (std::size_t view = 0; view < private_encoders_.size(); ++view) {
                auto [private_mu, private_logvar] = private_encoders_[view]->forward(x[view]);
                posteriors.push_back(Distribution::Gaussian(torch::cat({mu, private_mu}, 1),
                                                            torch::cat({logvar, private_logvar}, 1)));
            }
            return posteriors;
        }

        std::vector<std::vector<Distribution::Normal>> decode(const std::vector<torch::Tensor>& z) override {
            const auto expected = options_.private_latent ? n_views() : std::size_t{1};
            if (z.size() != expected) {
                throw std::invalid_argument("DVCCA expects " + std::to_string(expected) + " latent(s), got "
                                            + std::to_string(z.size()) + '.');
            }
            std::vector<std::vector<Distribution::Normal>> px_zs(decoders_.size());
            for (std::size_t view = 0; view < decoders_.size(); ++view) {
                const auto& latent = options_.private_latent ? z[view] : z.front();
                px_zs[view].push_back(decoders_[view]->forward(latent));
            }
            return px_zs;
        }

        [[nodiscard]] std::string model_type() const override { return sparse() ? "sparse_DVCCA" : "DVCCA"; }

        [[nodiscard]] bool private_latent() const noexcept { return options_.private_latent; }

    protected:
        torch::Tensor sample(const Distribution::Normal& qz_x) const override { return qz_x.sample(is_training()); }

        Optimizer::Partition build_partition() const override {
            Optimizer::Partition partition(Optimizer::PartitionMode::PerGroup);
            partition.add("shared_encoder", shared_encoder_->parameters());
            for (std::size_t view = 0; view < private_encoders_.size(); ++view) {
                partition.add("private_encoder_" + std::to_string(view), private_encoders_[view]->parameters());
            }
            for (std::size_t view = 0; view < decoders_.size(); ++view) {
                partition.add("decoder_" + std::to_string(view), decoders_[view]->parameters());
            }
            return partition;
        }

        [[nodiscard]] std::vector<std::pair<std::string, std::string>> summary_rows() const override {
            auto rows = ModelBase::summary_rows();
            rows.emplace_back("shared input", std::string(to_string(options_.shared_input)));
            rows.emplace_back("private latents", options_.private_latent ? "on" : "off");
            return rows;
        }

    private:
        [[nodiscard]] std::int64_t shared_input_dim() const {
            if (options_.shared_input == SharedInput::AllViews) {
                return std::accumulate(input_dims().begin(), input_dims().end(), std::int64_t{0});
            }
            return input_dims().front();
        }

        std::shared_ptr<Layer::EncoderModule> shared_encoder_{};
        std::vector<std::shared_ptr<Layer::EncoderModule>> private_encoders_{};
        std::vector<std::shared_ptr<Layer::DecoderModule>> decoders_{};
    };
}

#endif // POLYVIEW_MODEL_DVCCA_HPP
