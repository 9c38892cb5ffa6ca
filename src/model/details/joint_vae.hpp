#ifndef POLYVIEW_MODEL_JOINT_VAE_HPP
#define POLYVIEW_MODEL_JOINT_VAE_HPP

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../../fusion/fusion.hpp"
#include "base.hpp"

namespace Polyview::Model::Details {

    /*
     * Multi-view VAE with one joint latent.
     *  - per-view encoders, posteriors fused by Mean or Product of Experts.
     *  - every decoder reads the same latent sample.
     *  - views are coupled through the fused posterior, so a single optimizer
     *    holds one param group per view.
     */
    class JointVAE : public ModelBase {
    public:
        explicit JointVAE(ModelOptions options)
            : JointVAE(options, Fusion::make_descriptor(options.join_type)) {}

        JointVAE(ModelOptions options, Fusion::Descriptor fusion)
            : ModelBase(std::move(options)), fusion_(std::move(fusion))
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
            std::vector<torch::Tensor> mu;
            std::vector<torch::Tensor> logvar;
            mu.reserve(encoders_.size());
            logvar.reserve(encoders_.size());
            for (std::size_t view = 0; view < encoders_.size(); ++view) {
                auto [view_mu, view_logvar] = encoders_[view]->forward(x[view]);
                mu.push_back(std::move(view_mu));
                logvar.push_back(std::move(view_logvar));
            }
            auto [joint_mu, joint_logvar] = Fusion::fuse(fusion_, mu, logvar);
            return {Distribution::Gaussian(std::move(joint_mu), std::move(joint_logvar))};
        }

        std::vector<std::vector<Distribution::Normal>> decode(const std::vector<torch::Tensor>& z) override {
            if (z.size() != 1) {
                throw std::invalid_argument("Joint VAE decodes a single shared latent, got " + std::to_string(z.size()) + '.');
            }
            std::vector<std::vector<Distribution::Normal>> px_zs(decoders_.size());
            for (std::size_t view = 0; view < decoders_.size(); ++view) {
                px_zs[view].push_back(decoders_[view]->forward(z.front()));
            }
            return px_zs;
        }

        [[nodiscard]] std::string model_type() const override { return sparse() ? "joint_sparse_VAE" : "joint_VAE"; }

        [[nodiscard]] const Fusion::Descriptor& fusion() const noexcept { return fusion_; }

    protected:
        torch::Tensor sample(const Distribution::Normal& qz_x) const override { return qz_x.rsample(); }

        Optimizer::Partition build_partition() const override {
            Optimizer::Partition partition(Optimizer::PartitionMode::Grouped);
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
            rows.emplace_back("fusion", std::string(Fusion::name(fusion_)));
            return rows;
        }

    private:
        Fusion::Descriptor fusion_;
        std::vector<std::shared_ptr<Layer::EncoderModule>> encoders_{};
        std::vector<std::shared_ptr<Layer::DecoderModule>> decoders_{};
    };
}

#endif // POLYVIEW_MODEL_JOINT_VAE_HPP
