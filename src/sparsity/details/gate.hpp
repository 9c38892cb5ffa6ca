#ifndef POLYVIEW_SPARSITY_GATE_HPP
#define POLYVIEW_SPARSITY_GATE_HPP

#include <cstdint>
#include <sstream>
#include <stdexcept>

#include <torch/torch.h>

namespace Polyview::Sparsity::Details {

    struct GateOptions {
        std::int64_t width{};
        double init_std{0.01};
    };

    // Owns log_alpha [1, width]. Encoders read column blocks of it through slice().
    class GateImpl : public torch::nn::Module {
    public:
        explicit GateImpl(const GateOptions& options)
        {
            if (options.width <= 0) {
                throw std::invalid_argument("Sparsity gate requires a positive width.");
            }
            log_alpha_ = register_parameter("log_alpha", torch::empty({1, options.width}).normal_(0.0, options.init_std));
        }

        [[nodiscard]] const torch::Tensor& log_alpha() const noexcept { return log_alpha_; }
        [[nodiscard]] std::int64_t width() const { return log_alpha_.size(1); }

        // Re-sliced on every call so each forward pass builds its own autograd edge.
        [[nodiscard]] torch::Tensor slice(std::int64_t offset, std::int64_t width) const {
            if (offset < 0 || width <= 0 || offset + width > this->width()) {
                std::ostringstream message;
                message << "Sparsity gate slice [" << offset << ", " << offset + width
                        << ") is outside the gate width " << this->width() << '.';
                throw std::out_of_range(message.str());
            }
            return log_alpha_.narrow(1, offset, width);
        }

    private:
        torch::Tensor log_alpha_{};
    };

    TORCH_MODULE(Gate);
}

#endif // POLYVIEW_SPARSITY_GATE_HPP
