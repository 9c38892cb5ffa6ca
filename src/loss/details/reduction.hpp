#ifndef POLYVIEW_LOSS_REDUCTION_HPP
#define POLYVIEW_LOSS_REDUCTION_HPP

#include <stdexcept>

#include <torch/torch.h>

namespace Polyview::Loss::Details {

    // Batch reduction applied after the feature / latent axis has been summed.
    enum class Reduction { Mean, Sum, None };

    inline torch::Tensor apply_reduction(torch::Tensor loss, Reduction reduction) {
        switch (reduction) {
            case Reduction::None:
                return loss;
            case Reduction::Sum:
                return loss.sum();
            case Reduction::Mean:
            default:
                return loss.mean();
        }
    }

    // [batch, features] -> sum over features -> reduce over batch.
    inline torch::Tensor reduce_elementwise(const torch::Tensor& elementwise, Reduction reduction = Reduction::Mean) {
        if (elementwise.dim() != 2) {
            throw std::invalid_argument("Loss reduction expects a [batch, features] tensor.");
        }
        return apply_reduction(elementwise.sum(1), reduction);
    }
}

#endif // POLYVIEW_LOSS_REDUCTION_HPP
