#ifndef POLYVIEW_SPARSITY_THRESHOLD_HPP
#define POLYVIEW_SPARSITY_THRESHOLD_HPP
// Variational dropout pruning, after the sparse multi-channel VAE (Antelmi et al. 2019) http://proceedings.mlr.press/v97/antelmi19a.html
#include <sstream>
#include <stdexcept>
#include <vector>

#include <torch/torch.h>

namespace Polyview::Sparsity::Details {

    inline void check_threshold(double threshold) {
        if (!(threshold > 0.0) || threshold > 1.0) {
            std::ostringstream message;
            message << "Sparsity threshold must lie in (0, 1], got " << threshold << '.';
            throw std::invalid_argument(message.str());
        }
    }

    // exp(a) / (exp(a) + 1), detached: pruning never feeds gradients back.
    [[nodiscard]] inline torch::Tensor dropout_rate(const torch::Tensor& log_alpha) {
        if (!log_alpha.defined()) {
            throw std::invalid_argument("dropout_rate requires a defined log_alpha tensor.");
        }
        return torch::sigmoid(log_alpha.detach());
    }

    // [z_dim] bool, true where the dimension survives.
    [[nodiscard]] inline torch::Tensor keep_mask(const torch::Tensor& log_alpha, double threshold) {
        check_threshold(threshold);
        return (dropout_rate(log_alpha) < threshold).reshape({-1});
    }

    // Zeroes every column whose dropout rate reaches the threshold; same mask for every row.
    [[nodiscard]] inline torch::Tensor apply_threshold(const torch::Tensor& z, const torch::Tensor& log_alpha, double threshold) {
        const auto keep = keep_mask(log_alpha, threshold);
        if (z.dim() != 2 || z.size(1) != keep.size(0)) {
            std::ostringstream message;
            message << "apply_threshold expects latents of shape [batch, " << keep.size(0)
                    << "], got " << z.sizes() << '.';
            throw std::invalid_argument(message.str());
        }
        const auto drop = keep.logical_not().to(z.device()).unsqueeze(0).expand_as(z);
        return z.masked_fill(drop, 0.0);
    }

    [[nodiscard]] inline std::vector<torch::Tensor> apply_threshold(const std::vector<torch::Tensor>& z,
                                                                    const torch::Tensor& log_alpha,
                                                                    double threshold) {
        check_threshold(threshold);
        std::vector<torch::Tensor> pruned;
        pruned.reserve(z.size());
        for (const auto& latent : z) {
            pruned.push_back(apply_threshold(latent, log_alpha, threshold));
        }
        return pruned;
    }
}

#endif // POLYVIEW_SPARSITY_THRESHOLD_HPP
