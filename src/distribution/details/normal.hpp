#ifndef POLYVIEW_DISTRIBUTION_NORMAL_HPP
#define POLYVIEW_DISTRIBUTION_NORMAL_HPP

#include <sstream>
#include <stdexcept>
#include <utility>

#include <torch/torch.h>

#include "kl.hpp"

namespace Polyview::Distribution::Details {

    /*
     * Diagonal Gaussian parameterised by location and log-variance.
     * ---------------------------------------------------------------------------
     *  - scale = exp(0.5 * logvar); the log-variance is kept so KL and log
     *    densities never exponentiate a raw variance.
     *  - logvar may broadcast against loc (decoders share one [1, F] row).
     *  - All reductions are left to the caller: every method below returns
     *    elementwise tensors of the broadcast shape.
     */
    class Normal {
    public:
        Normal() = default;

        Normal(torch::Tensor loc, torch::Tensor logvar)
            : loc_(std::move(loc)), logvar_(std::move(logvar))
        {
            if (!loc_.defined() || !logvar_.defined()) {
                throw std::invalid_argument("Normal requires defined loc and logvar tensors.");
            }
        }

        [[nodiscard]] static Normal from_logvar(torch::Tensor loc, torch::Tensor logvar) {
            return Normal(std::move(loc), std::move(logvar));
        }

        // Unit prior N(0, I) with the shape, dtype and device of reference.
        [[nodiscard]] static Normal standard_like(const torch::Tensor& reference) {
            return Normal(torch::zeros_like(reference), torch::zeros_like(reference));
        }

        [[nodiscard]] bool defined() const noexcept { return loc_.defined() && logvar_.defined(); }

        [[nodiscard]] const torch::Tensor& loc() const noexcept { return loc_; }
        [[nodiscard]] const torch::Tensor& logvar() const noexcept { return logvar_; }
        [[nodiscard]] torch::Tensor scale() const { return torch::exp(0.5 * logvar_); }
        [[nodiscard]] torch::Tensor variance() const { return torch::exp(logvar_); }

        [[nodiscard]] torch::Tensor mean() const { return loc_; }

        // z = mu + eps * std, eps ~ N(0, 1)
        [[nodiscard]] torch::Tensor rsample() const {
            const auto stddev = scale().expand_as(loc_);
            return loc_ + torch::randn_like(loc_) * stddev;
        }

        [[nodiscard]] torch::Tensor sample(bool training) const {
            return training ? rsample() : mean();
        }

        [[nodiscard]] torch::Tensor log_likelihood(const torch::Tensor& x) const {
            if (x.sizes() != loc_.sizes()) {
                std::ostringstream message;
                message << "Normal::log_likelihood expected an input of shape " << loc_.sizes()
                        << " but received " << x.sizes() << ".";
                throw std::invalid_argument(message.str());
            }
            return gaussian_log_prob(x, loc_, logvar_);
        }

        [[nodiscard]] torch::Tensor kl_divergence(const Normal& prior) const {
            if (!prior.defined()) {
                throw std::invalid_argument("Normal::kl_divergence requires a defined prior.");
            }
            return gaussian_kl(loc_, logvar_, prior.loc_, prior.logvar_);
        }

        // Against N(0, I).
        [[nodiscard]] torch::Tensor kl_divergence() const {
            return standard_gaussian_kl(loc_, logvar_);
        }

        // Implicit log-uniform prior; used instead of kl_divergence on sparse models.
        [[nodiscard]] torch::Tensor sparse_kl_divergence() const {
            return sparse_kl(loc_, logvar_);
        }

    private:
        torch::Tensor loc_{};
        torch::Tensor logvar_{};
    };
}

#endif // POLYVIEW_DISTRIBUTION_NORMAL_HPP
