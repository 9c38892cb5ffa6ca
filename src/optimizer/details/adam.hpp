#ifndef POLYVIEW_ADAM_HPP
#define POLYVIEW_ADAM_HPP

#include <sstream>
#include <stdexcept>
#include <string_view>
#include <tuple>

#include <torch/torch.h>

namespace Polyview::Optimizer::Details {

    // 2e-3 matches ModelOptions::learning_rate.
    struct AdamOptions {
        double learning_rate{2e-3};
        double beta1{0.9};
        double beta2{0.999};
        double eps{1e-8};
        double weight_decay{0.0};
        bool amsgrad{false};
    };

    struct AdamDescriptor {
        AdamOptions options{};
    };

    // Decoupled weight decay variant.
    struct AdamWOptions {
        double learning_rate{2e-3};
        double beta1{0.9};
        double beta2{0.999};
        double eps{1e-8};
        double weight_decay{1e-2};
        bool amsgrad{false};
    };

    struct AdamWDescriptor {
        AdamWOptions options{};
    };

    namespace detail {
        inline void check_rate(std::string_view optimizer, double learning_rate, double weight_decay) {
            if (!(learning_rate > 0.0) || weight_decay < 0.0) {
                std::ostringstream message;
                message << optimizer << " requires learning_rate > 0 and weight_decay >= 0, got "
                        << learning_rate << " and " << weight_decay << '.';
                throw std::invalid_argument(message.str());
            }
        }

        // AdamOptions and AdamWOptions expose the same setters.
        template <class TorchOptions, class Options>
        TorchOptions adam_family(std::string_view optimizer, const Options& options) {
            check_rate(optimizer, options.learning_rate, options.weight_decay);
            if (options.beta1 < 0.0 || options.beta1 >= 1.0 || options.beta2 < 0.0 || options.beta2 >= 1.0) {
                std::ostringstream message;
                message << optimizer << " betas must lie in [0, 1), got (" << options.beta1 << ", " << options.beta2 << ").";
                throw std::invalid_argument(message.str());
            }
            return TorchOptions(options.learning_rate)
                .betas(std::make_tuple(options.beta1, options.beta2))
                .eps(options.eps)
                .weight_decay(options.weight_decay)
                .amsgrad(options.amsgrad);
        }
    }

    inline torch::optim::AdamOptions to_torch_options(const AdamOptions& options) {
        return detail::adam_family<torch::optim::AdamOptions>("Adam", options);
    }

    inline torch::optim::AdamWOptions to_torch_options(const AdamWOptions& options) {
        return detail::adam_family<torch::optim::AdamWOptions>("AdamW", options);
    }

    [[nodiscard]] constexpr std::string_view name(const AdamDescriptor&) noexcept { return "Adam"; }
    [[nodiscard]] constexpr std::string_view name(const AdamWDescriptor&) noexcept { return "AdamW"; }
}

#endif // POLYVIEW_ADAM_HPP
