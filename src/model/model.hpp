#ifndef POLYVIEW_MODEL_HPP
#define POLYVIEW_MODEL_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"

#include <memory>
#include <string_view>

#include "details/output.hpp"
#include "details/base.hpp"
#include "details/vae.hpp"
#include "details/joint_vae.hpp"
#include "details/dvcca.hpp"
#include "details/registry.hpp"

namespace Polyview::Model {
    using ForwardOutput = Details::ForwardOutput;
    using Views = Details::Views;
    using OptimizerList = Details::OptimizerList;

    using Base = Details::ModelBase;
    using IndependentVAE = Details::IndependentVAE;
    using JointVAE = Details::JointVAE;
    using DVCCA = Details::DVCCA;

    [[nodiscard]] inline auto make(std::string_view name, const ModelOptions& options) -> std::shared_ptr<Base> {
        return Details::make(name, options);
    }
}

#endif // POLYVIEW_MODEL_HPP
