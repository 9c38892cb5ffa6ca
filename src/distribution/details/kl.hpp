#ifndef POLYVIEW_DISTRIBUTION_KL_HPP
#define POLYVIEW_DISTRIBUTION_KL_HPP

#include <torch/torch.h>

namespace Polyview::Distribution::Details {
    // log(2 * pi)
    inline constexpr double kLogTwoPi = 1.8378770664093453;
    // Guards log(mu^2) against mu == 0.
    inline constexpr double kMuSquaredEpsilon = 1e-8;

    // "Variational Dropout Sparsifies Deep Neural Networks" (Molchanov et al. 2017) https://arxiv.org/abs/1701.05369
    struct SparseKLConstants {
        double k1{0.63576};
        double k2{1.87320};
        double k3{1.48695};
    };

    [[nodiscard]] inline torch::Tensor log_alpha_from(const torch::Tensor& mu, const torch::Tensor& logvar) {
        return logvar - torch::log(mu.pow(2) + kMuSquaredEpsilon);
    }

    [[nodiscard]] inline torch::Tensor logvar_from(const torch::Tensor& mu, const torch::Tensor& log_alpha) {
        return log_alpha + torch::log(mu.pow(2) + kMuSquaredEpsilon);
    }

    // Elementwise KL(N(mu_q, var_q) || N(mu_p, var_p)), variances given as log-variances.
    [[nodiscard]] inline torch::Tensor gaussian_kl(const torch::Tensor& mu_q,
                                                   const torch::Tensor& logvar_q,
                                                   const torch::Tensor& mu_p,
                                                   const torch::Tensor& logvar_p) {
        const auto variance_ratio = torch::exp(logvar_q - logvar_p);
        const auto mean_term = (mu_q - mu_p).pow(2) * torch::exp(-logvar_p);
        return 0.5 * (variance_ratio + mean_term - 1.0 - (logvar_q - logvar_p));
    }

    // Elementwise KL against the standard normal: -0.5 * (1 + logvar - mu^2 - exp(logvar)).
    [[nodiscard]] inline torch::Tensor standard_gaussian_kl(const torch::Tensor& mu, const torch::Tensor& logvar) {
        return -0.5 * (1.0 + logvar - mu.pow(2) - torch::exp(logvar));
    }

    // Polynomial-sigmoid approximation of KL(q || log-uniform) for variational dropout.
    // log1p(exp(-x)) is evaluated as softplus(-x).
    [[nodiscard]] inline torch::Tensor sparse_kl(const torch::Tensor& mu,
                                                 const torch::Tensor& logvar,
                                                 const SparseKLConstants& constants = {}) {
        const auto log_alpha = log_alpha_from(mu, logvar);
        const auto negative_kl = constants.k1 * torch::sigmoid(constants.k2 + constants.k3 * log_alpha)
                               - 0.5 * torch::softplus(-log_alpha)
                               - constants.k1;
        return -negative_kl;
    }

    // Elementwise Gaussian log density.
    [[nodiscard]] inline torch::Tensor gaussian_log_prob(const torch::Tensor& x,
                                                         const torch::Tensor& loc,
                                                         const torch::Tensor& logvar) {
        return -0.5 * (kLogTwoPi + logvar + (x - loc).pow(2) * torch::exp(-logvar));
    }
}

#endif // POLYVIEW_DISTRIBUTION_KL_HPP
