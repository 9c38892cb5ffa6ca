#ifndef POLYVIEW_LIBRARY_H
#define POLYVIEW_LIBRARY_H

#include "../src/core.hpp"

// Public umbrella header.
// -----------------------------------------------------------------------------
//  - Re-exports the full API surface: options, model registry, fusion,
//    sparsity, losses, optimizer descriptors and the training step.
//  - Header-only; every implementation lives under src/<module>/details.

#endif // POLYVIEW_LIBRARY_H
