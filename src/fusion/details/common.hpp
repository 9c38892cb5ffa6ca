#ifndef POLYVIEW_FUSION_COMMON_HPP
#define POLYVIEW_FUSION_COMMON_HPP

#include <sstream>
#include <stdexcept>
#include <string_view>

#include <torch/torch.h>

namespace Polyview::Fusion::Details {

    // Both inputs must be stacked as [n_views, batch, z_dim].
    inline void check_stacked(const torch::Tensor& mu, const torch::Tensor& logvar, std::string_view strategy) {
        if (!mu.defined() || !logvar.defined()) {
            std::ostringstream message;
            message << strategy << " fusion requires defined mu and logvar tensors.";
            throw std::invalid_argument(message.str());
        }
        if (mu.dim() != 3 || mu.sizes() != logvar.sizes()) {
            std::ostringstream message;
            message << strategy << " fusion expects mu and logvar of shape [n_views, batch, z_dim], got "
                    << mu.sizes() << " and " << logvar.sizes() << '.';
            throw std::invalid_argument(message.str());
        }
        if (mu.size(0) == 0) {
            std::ostringstream message;
            message << strategy << " fusion requires at least one view.";
            throw std::invalid_argument(message.str());
        }
    }
}

#endif // POLYVIEW_FUSION_COMMON_HPP
