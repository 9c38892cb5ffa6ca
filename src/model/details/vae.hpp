#ifndef POLYVIEW_MODEL_VAE_HPP
#define POLYVIEW_MODEL_VAE_HPP

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "base.hpp"

namespace Polyview::Model::Details {

    /*
     * Independent per-view VAE (multi-channel VAE when cross_reconstruction is on).
     *  - one encoder / decoder pair per view, one posterior per view.
     *  - cross_reconstruction: px_zs[i][j] = decoder_i(z_j); otherwise px_zs[i] = {decoder_i(z_i)}.
     *  - KL is summed over the per-view posteriors.
     *  - one optimizer per view; the gate (if any) is shared by every encoder.
     */
    class IndependentVAE : public ModelBase {
    public:
        explicit IndependentVAE(ModelOptions options) : ModelBase(std::move(options))
        {
            create_gate(z_dim());
            for (std::size_t view = 0; view < n_views(); ++view) {
                encoders_.push_back(make_encoder("encoder_" + std::to_string(view), input_dims()[view], z_dim(), 0));
            }
            for (std::size_t view = 0; view < n_views(); ++view) {
                decoders_.push_back(make_decoder("decoder_" + std::to_string(view), input_dims()[view]));
            }
            finalize();
        }

        std::vector<Distribution::Normal> encode(const Views& x) override {
            check_views(x);
            std::vector<Distribution::Normal> posteriors;
            posteriors.reserve(encoders_.size());
            for (std::size_t view = 0; view < encoders_.size(); ++view) {
                auto [mu, logvar] = encoders_[view]->forward(x[view]);
                posteriors.emplace_back(std::move(mu), std::move(logvar));
            }
            return posteriors;
        }

        std::vector<std::vector<Distribution::Normal>> decode(const std::vector<torch::Tensor>& z) override {
            if (z.size() != n_views()) {
                throw std::invalid_argument("Independent VAE decodes one latent per view, got "
                                            + std::to_string(z.size()) + " for " + std::to_string(n_views()) + " views.");
            }
            std::vector<std::vector<Distribution::Normal>> px_zs(decoders_.size());
            for (std::size_t view = 0; view < decoders_.size(); ++view) {
                if (!options_.cross_reconstruction) {
                    px_zs[view].push_back(decoders_[view]->forward(z[view]));
                    continue;
                }
                for (const auto& latent : z) {
                    px_zs[view].push_back(decoders_[view]->forward(latent));
                }
            }
            return px_zs;
        }

        [[nodiscard]] std::string model_type() const override { return sparse() ? "sparse_VAE" : "VAE"; }

        [[nodiscard]] const std::vector<std::shared_ptr<Layer::EncoderModule>>& encoders() const noexcept { return encoders_; }
        [[nodiscard]] const std::vector<std::shared_ptr<Layer::DecoderModule>>& decoders() const noexcept { return decoders_; }

    protected:
        torch::Tensor sample(const Distribution::Normal& qz_x) const override { return qz_x.rsample(); }

        Optimizer::Partition build_partition() const override {
            Optimizer::Partition partition(Optimizer::PartitionMode::PerGroup);
            for (std::size_t view = 0; view < n_views(); ++view) {
                auto parameters = encoders_[view]->parameters();
                const auto decoder_parameters = decoders_[view]->parameters();
                parameters.insert(parameters.end(), decoder_parameters.begin(), decoder_parameters.end());
                partition.add("view_" + std::to_string(view), std::move(parameters));
            }
            return partition;
        }

        [[nodiscard]] std::vector<std::pair<std::string, std::string>> summary_rows() const override {
            auto rows = ModelBase::summary_rows();
            rows.emplace_back("cross reconstruction", options_.cross_reconstruction ? "on" : "off");
            return rows;
        }

    private:
        std::vector<std::shared_ptr<Layer::EncoderModule>> encoders_{};
        std::vector<std::shared_ptr<Layer::DecoderModule>> decoders_{};
    };
}

#endif // POLYVIEW_MODEL_VAE_HPP
