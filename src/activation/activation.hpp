#ifndef POLYVIEW_ACTIVATION_HPP
#define POLYVIEW_ACTIVATION_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "apply.hpp"

#include <string_view>

namespace Polyview::Activation {
    enum class Type {
        Identity,
        ReLU,
        LeakyReLU,
        Tanh,
        Sigmoid,
        SiLU,
        GeLU,
    };

    struct Descriptor {
        Type type{Type::Identity};
    };

    inline constexpr Descriptor Identity{Type::Identity};
    inline constexpr Descriptor ReLU{Type::ReLU};
    inline constexpr Descriptor LeakyReLU{Type::LeakyReLU};
    inline constexpr Descriptor Tanh{Type::Tanh};
    inline constexpr Descriptor Sigmoid{Type::Sigmoid};
    inline constexpr Descriptor SiLU{Type::SiLU};
    inline constexpr Descriptor GeLU{Type::GeLU};

    [[nodiscard]] constexpr std::string_view to_string(Type type) noexcept {
        switch (type) {
            case Type::ReLU:      return "ReLU";
            case Type::LeakyReLU: return "LeakyReLU";
            case Type::Tanh:      return "Tanh";
            case Type::Sigmoid:   return "Sigmoid";
            case Type::SiLU:      return "SiLU";
            case Type::GeLU:      return "GeLU";
            case Type::Identity:
            default:              return "Identity";
        }
    }
}

#endif //POLYVIEW_ACTIVATION_HPP
