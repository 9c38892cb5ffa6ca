#ifndef POLYVIEW_MODEL_REGISTRY_HPP
#define POLYVIEW_MODEL_REGISTRY_HPP

#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

#include "../../fusion/fusion.hpp"
#include "base.hpp"
#include "dvcca.hpp"
#include "joint_vae.hpp"
#include "vae.hpp"

namespace Polyview::Model::Details {

    // Named constructors. "mVAE" and "me_mVAE" pin the join type and "mcVAE" pins
    // cross reconstruction, regardless of options.
    [[nodiscard]] inline std::shared_ptr<ModelBase> make(std::string_view name, ModelOptions options) {
        if (name == "VAE") {
            return std::make_shared<IndependentVAE>(std::move(options));
        }
        if (name == "mcVAE") {
            options.cross_reconstruction = true;
            return std::make_shared<IndependentVAE>(std::move(options));
        }
        if (name == "joint_VAE") {
            return std::make_shared<JointVAE>(std::move(options));
        }
        if (name == "mVAE") {
            options.join_type = Fusion::JoinType::PoE;
            return std::make_shared<JointVAE>(std::move(options));
        }
        if (name == "me_mVAE") {
            options.join_type = Fusion::JoinType::Mean;
            return std::make_shared<JointVAE>(std::move(options));
        }
        if (name == "DVCCA") {
            return std::make_shared<DVCCA>(std::move(options));
        }
        throw std::invalid_argument("Unknown model '" + std::string(name)
                                    + "'. Expected one of VAE, mcVAE, joint_VAE, mVAE, me_mVAE, DVCCA.");
    }
}

#endif // POLYVIEW_MODEL_REGISTRY_HPP
