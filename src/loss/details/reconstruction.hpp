#ifndef POLYVIEW_LOSS_RECONSTRUCTION_HPP
#define POLYVIEW_LOSS_RECONSTRUCTION_HPP

#include <sstream>
#include <stdexcept>

#include <torch/torch.h>

#include "reduction.hpp"

namespace Polyview::Loss::Details {

    struct ReconstructionOptions {
        Reduction reduction{Reduction::Mean};
    };

    // Squared error summed over features, then reduced over the batch.
    [[nodiscard]] inline torch::Tensor reconstruction_error(const torch::Tensor& x,
                                                            const torch::Tensor& x_hat,
                                                            const ReconstructionOptions& options = {}) {
        if (x.sizes() != x_hat.sizes()) {
            std::ostringstream message;
            message << "Reconstruction error expects matching shapes, got " << x.sizes()
                    << " and " << x_hat.sizes() << '.';
            throw std::invalid_argument(message.str());
        }
        return reduce_elementwise((x_hat - x).pow(2), options.reduction);
    }
}

#endif // POLYVIEW_LOSS_RECONSTRUCTION_HPP
