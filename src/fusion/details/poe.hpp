#ifndef POLYVIEW_FUSION_POE_HPP
#define POLYVIEW_FUSION_POE_HPP
// "Training Products of Experts by Minimizing Contrastive Divergence" (Hinton 2002) https://arxiv.org/pdf/1410.7827.pdf
#include <cmath>
#include <stdexcept>
#include <utility>

#include <torch/torch.h>

#include "common.hpp"

namespace Polyview::Fusion::Details {

    struct ProductOfExpertsOptions {
        bool prior_expert{true}; // N(0, 1) expert with unit precision
        double eps{1e-8};
    };

    struct ProductOfExpertsDescriptor {
        ProductOfExpertsOptions options{};
    };

    [[nodiscard]] inline std::pair<torch::Tensor, torch::Tensor> fuse(const ProductOfExpertsDescriptor& descriptor,
                                                                      const torch::Tensor& mu,
                                                                      const torch::Tensor& logvar) {
        check_stacked(mu, logvar, "Product of Experts");
        const auto& options = descriptor.options;
        if (!(options.eps > 0.0)) {
            throw std::invalid_argument("Product of Experts requires a positive eps.");
        }

        // 1 / (var + eps) taken in log space; the floor on logvar caps precision at 1 / eps.
        const auto precision = torch::exp(-logvar.clamp_min(std::log(options.eps)));

        auto fused_precision = precision.sum(0);
        auto weighted_mu = (mu * precision).sum(0);
        if (options.prior_expert) {
            // The prior contributes precision 1 and mean 0, so only the denominator moves.
            fused_precision = fused_precision + 1.0;
        }

        auto fused_mu = weighted_mu / fused_precision;
        auto fused_logvar = -torch::log(fused_precision);
        return {std::move(fused_mu), std::move(fused_logvar)};
    }
}

#endif // POLYVIEW_FUSION_POE_HPP
