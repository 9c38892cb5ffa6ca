#ifndef POLYVIEW_CORE_HPP
#define POLYVIEW_CORE_HPP
/*
 * Core entry point of the library.
 * ---------------------------------------------------------------------------
 * Responsibilities:
 *  - Pull every module factory into one translation unit so applications
 *    include a single header.
 *  - Keep construction declarative: a ModelOptions aggregate (optionally
 *    patched by Config::apply_overrides) plus a registry name yields a fully
 *    wired model whose optimizer partition is already fixed.
 *  - Leave iteration to the caller; Training::step runs exactly one update.
 */

#include <torch/torch.h>

#include "activation/activation.hpp"
#include "initialization/initialization.hpp"
#include "distribution/distribution.hpp"
#include "fusion/fusion.hpp"
#include "sparsity/sparsity.hpp"
#include "loss/loss.hpp"
#include "optimizer/optimizer.hpp"
#include "layer/layer.hpp"
#include "common/options.hpp"
#include "common/config.hpp"
#include "model/model.hpp"
#include "training/training.hpp"
#include "utils/terminal.hpp"

#endif // POLYVIEW_CORE_HPP
