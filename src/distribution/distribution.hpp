#ifndef POLYVIEW_DISTRIBUTION_HPP
#define POLYVIEW_DISTRIBUTION_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"

#include <utility>

#include <torch/torch.h>

#include "details/kl.hpp"
#include "details/normal.hpp"

namespace Polyview::Distribution {
    using Normal = Details::Normal;
    using SparseKLConstants = Details::SparseKLConstants;

    [[nodiscard]] inline auto Gaussian(torch::Tensor loc, torch::Tensor logvar) -> Normal {
        return Normal::from_logvar(std::move(loc), std::move(logvar));
    }

    [[nodiscard]] inline auto StandardNormal(const torch::Tensor& reference) -> Normal {
        return Normal::standard_like(reference);
    }
}

#endif // POLYVIEW_DISTRIBUTION_HPP
