#ifndef POLYVIEW_COMMON_CONFIG_HPP
#define POLYVIEW_COMMON_CONFIG_HPP

#include <cmath>
#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "options.hpp"

namespace Polyview::Config {
    using Value = std::variant<bool, std::int64_t, double, std::string, std::vector<std::int64_t>>;
    using Override = std::pair<std::string, Value>;

    namespace Details {
        [[nodiscard]] inline std::invalid_argument type_error(std::string_view key, std::string_view expected) {
            std::ostringstream message;
            message << "Model option '" << key << "' expects a " << expected << " value.";
            return std::invalid_argument(message.str());
        }

        [[nodiscard]] inline bool as_bool(std::string_view key, const Value& value) {
            if (const auto* flag = std::get_if<bool>(&value)) {
                return *flag;
            }
            throw type_error(key, "boolean");
        }

        [[nodiscard]] inline std::int64_t as_int(std::string_view key, const Value& value) {
            if (const auto* number = std::get_if<std::int64_t>(&value)) {
                return *number;
            }
            throw type_error(key, "integer");
        }

        // Integers are accepted where a real number is expected.
        [[nodiscard]] inline double as_real(std::string_view key, const Value& value) {
            if (const auto* number = std::get_if<double>(&value)) {
                return *number;
            }
            if (const auto* number = std::get_if<std::int64_t>(&value)) {
                return static_cast<double>(*number);
            }
            throw type_error(key, "numeric");
        }

        [[nodiscard]] inline const std::string& as_string(std::string_view key, const Value& value) {
            if (const auto* text = std::get_if<std::string>(&value)) {
                return *text;
            }
            throw type_error(key, "string");
        }

        [[nodiscard]] inline const std::vector<std::int64_t>& as_dims(std::string_view key, const Value& value) {
            if (const auto* dims = std::get_if<std::vector<std::int64_t>>(&value)) {
                return *dims;
            }
            throw type_error(key, "integer list");
        }
    }

    [[nodiscard]] inline SharedInput parse_shared_input(std::string_view name) {
        if (name == "FirstView") {
            return SharedInput::FirstView;
        }
        if (name == "AllViews") {
            return SharedInput::AllViews;
        }
        throw std::invalid_argument("Unknown shared input '" + std::string(name) + "'. Expected \"FirstView\" or \"AllViews\".");
    }

    [[nodiscard]] inline Activation::Descriptor parse_activation(std::string_view name) {
        for (const auto type : {Activation::Type::Identity, Activation::Type::ReLU, Activation::Type::LeakyReLU,
                                Activation::Type::Tanh, Activation::Type::Sigmoid, Activation::Type::SiLU,
                                Activation::Type::GeLU}) {
            if (Activation::to_string(type) == name) {
                return Activation::Descriptor{type};
            }
        }
        throw std::invalid_argument("Unknown activation '" + std::string(name) + "'.");
    }

    // Writes one recognised key into options; unknown keys are rejected.
    inline void apply_override(ModelOptions& options, std::string_view key, const Value& value) {
        using namespace Details;
        if (key == "input_dims") {
            options.input_dims = as_dims(key, value);
        } else if (key == "z_dim") {
            options.z_dim = as_int(key, value);
        } else if (key == "hidden_layer_dims") {
            options.hidden_layer_dims = as_dims(key, value);
        } else if (key == "non_linear") {
            options.non_linear = as_bool(key, value);
        } else if (key == "activation") {
            options.activation = parse_activation(as_string(key, value));
        } else if (key == "learning_rate") {
            options.learning_rate = as_real(key, value);
        } else if (key == "beta") {
            options.beta = as_real(key, value);
        } else if (key == "threshold") {
            options.threshold = as_real(key, value);
        } else if (key == "join_type") {
            options.join_type = Fusion::parse_join_type(as_string(key, value));
        } else if (key == "private" || key == "private_latent") {
            options.private_latent = as_bool(key, value);
        } else if (key == "shared_input") {
            options.shared_input = parse_shared_input(as_string(key, value));
        } else if (key == "cross_reconstruction") {
            options.cross_reconstruction = as_bool(key, value);
        } else {
            throw std::invalid_argument("Unknown model option '" + std::string(key) + "'.");
        }
    }

    inline void apply_overrides(ModelOptions& options, const std::vector<Override>& overrides) {
        for (const auto& [key, value] : overrides) {
            apply_override(options, key, value);
        }
    }

    inline void validate(const ModelOptions& options) {
        if (options.input_dims.empty()) {
            throw std::invalid_argument("Model requires at least one view in input_dims.");
        }
        for (const auto dim : options.input_dims) {
            if (dim <= 0) {
                std::ostringstream message;
                message << "input_dims entries must be positive, got " << dim << '.';
                throw std::invalid_argument(message.str());
            }
        }
        if (options.z_dim <= 0) {
            std::ostringstream message;
            message << "z_dim must be positive, got " << options.z_dim << '.';
            throw std::invalid_argument(message.str());
        }
        for (const auto dim : options.hidden_layer_dims) {
            if (dim <= 0) {
                std::ostringstream message;
                message << "hidden_layer_dims entries must be positive, got " << dim << '.';
                throw std::invalid_argument(message.str());
            }
        }
        if (!(options.learning_rate > 0.0) || !std::isfinite(options.learning_rate)) {
            std::ostringstream message;
            message << "learning_rate must be positive and finite, got " << options.learning_rate << '.';
            throw std::invalid_argument(message.str());
        }
        if (!(options.beta >= 0.0) || !std::isfinite(options.beta)) {
            std::ostringstream message;
            message << "beta must be non-negative and finite, got " << options.beta << '.';
            throw std::invalid_argument(message.str());
        }
        if (!(options.threshold >= 0.0) || options.threshold > 1.0) {
            std::ostringstream message;
            message << "threshold must lie in [0, 1] (0 disables sparsity), got " << options.threshold << '.';
            throw std::invalid_argument(message.str());
        }
        if (options.logging.monitor && options.logging.stream == nullptr) {
            throw std::invalid_argument("Monitoring requires a non-null output stream.");
        }
    }
}

#endif // POLYVIEW_COMMON_CONFIG_HPP
