#ifndef POLYVIEW_TRAINING_HPP
#define POLYVIEW_TRAINING_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"

#include "details/step.hpp"

namespace Polyview::Training {
    using StepOptions = Details::StepOptions;

    using Details::print_step;
    using Details::step;
}

#endif // POLYVIEW_TRAINING_HPP
