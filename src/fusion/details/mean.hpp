#ifndef POLYVIEW_FUSION_MEAN_HPP
#define POLYVIEW_FUSION_MEAN_HPP

#include <cmath>
#include <utility>

#include <torch/torch.h>

#include "common.hpp"

namespace Polyview::Fusion::Details {

    struct MeanOptions {
        // false: average log-variances (compatible with previously trained models).
        // true : average variances, then take the log.
        bool average_variance{false};
    };

    struct MeanDescriptor {
        MeanOptions options{};
    };

    [[nodiscard]] inline std::pair<torch::Tensor, torch::Tensor> fuse(const MeanDescriptor& descriptor,
                                                                      const torch::Tensor& mu,
                                                                      const torch::Tensor& logvar) {
        check_stacked(mu, logvar, "Mean");
        auto fused_mu = mu.mean(0);
        if (descriptor.options.average_variance) {
            // log(mean(exp(l))) = logsumexp(l) - log(n)
            auto fused_logvar = torch::logsumexp(logvar, 0) - std::log(static_cast<double>(logvar.size(0)));
            return {std::move(fused_mu), std::move(fused_logvar)};
        }
        return {std::move(fused_mu), logvar.mean(0)};
    }
}

#endif // POLYVIEW_FUSION_MEAN_HPP
