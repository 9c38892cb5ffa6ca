#ifndef POLYVIEW_MODEL_OUTPUT_HPP
#define POLYVIEW_MODEL_OUTPUT_HPP

#include <cstddef>
#include <vector>

#include <torch/torch.h>

#include "../../distribution/details/normal.hpp"

namespace Polyview::Model::Details {

    /*
     * Result of one forward pass; never persisted.
     *  - qz_x: one posterior per view (independent), a single fused posterior
     *    (joint), or one concatenated shared+private posterior per view
     *    (disentangled). z is aligned with qz_x.
     *  - px_zs[i][j]: likelihood of view i decoded from latent j. Only
     *    cross-reconstructing models carry more than one entry per view.
     */
    struct ForwardOutput {
        std::vector<::Polyview::Distribution::Details::Normal> qz_x{};
        std::vector<torch::Tensor> z{};
        std::vector<std::vector<::Polyview::Distribution::Details::Normal>> px_zs{};

        // Decoder means, same layout as px_zs.
        [[nodiscard]] std::vector<std::vector<torch::Tensor>> reconstructions() const {
            std::vector<std::vector<torch::Tensor>> means;
            means.reserve(px_zs.size());
            for (const auto& row : px_zs) {
                auto& target = means.emplace_back();
                target.reserve(row.size());
                for (const auto& px_z : row) {
                    target.push_back(px_z.mean());
                }
            }
            return means;
        }
    };
}

#endif // POLYVIEW_MODEL_OUTPUT_HPP
