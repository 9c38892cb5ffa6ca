#ifndef POLYVIEW_LOSS_HPP
#define POLYVIEW_LOSS_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"

#include "details/reduction.hpp"
#include "details/terms.hpp"
#include "details/reconstruction.hpp"

namespace Polyview::Loss {
    using Reduction = Details::Reduction;
    using Terms = Details::Terms;
    using ReconstructionOptions = Details::ReconstructionOptions;

    using Details::assemble;
    using Details::reconstruction_error;
    using Details::reduce_elementwise;
}

#endif // POLYVIEW_LOSS_HPP
