#ifndef POLYVIEW_SPARSITY_HPP
#define POLYVIEW_SPARSITY_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"

#include "details/gate.hpp"
#include "details/threshold.hpp"

namespace Polyview::Sparsity {
    using GateOptions = Details::GateOptions;
    using Gate = Details::Gate;
    using GateImpl = Details::GateImpl;

    using Details::apply_threshold;
    using Details::check_threshold;
    using Details::dropout_rate;
    using Details::keep_mask;

    // threshold == 0 means "no sparsity" for the lifetime of a model.
    [[nodiscard]] constexpr bool enabled(double threshold) noexcept {
        return threshold != 0.0;
    }
}

#endif // POLYVIEW_SPARSITY_HPP
