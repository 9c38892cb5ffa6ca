#ifndef POLYVIEW_OPTIMIZER_HPP
#define POLYVIEW_OPTIMIZER_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <variant>

#include "registry.hpp"

#include "details/adam.hpp"
#include "details/sgd.hpp"
#include "details/partition.hpp"

namespace Polyview::Optimizer {
    using SGDOptions = Details::SGDOptions;
    using SGDDescriptor = Details::SGDDescriptor;

    using AdamOptions = Details::AdamOptions;
    using AdamDescriptor = Details::AdamDescriptor;

    using AdamWOptions = Details::AdamWOptions;
    using AdamWDescriptor = Details::AdamWDescriptor;

    using Descriptor = Details::Descriptor;

    using ParameterGroup = Details::ParameterGroup;
    using PartitionMode = Details::PartitionMode;
    using Partition = Details::Partition;

    using Details::name;

    [[nodiscard]] constexpr auto SGD(const SGDOptions& options = {}) noexcept -> SGDDescriptor {
        return SGDDescriptor{.options = options};
    }

    [[nodiscard]] constexpr auto Adam(const AdamOptions& options = {}) noexcept -> AdamDescriptor {
        return AdamDescriptor{.options = options};
    }

    [[nodiscard]] constexpr auto AdamW(const AdamWOptions& options = {}) noexcept -> AdamWDescriptor {
        return AdamWDescriptor{.options = options};
    }
}

#endif //POLYVIEW_OPTIMIZER_HPP
