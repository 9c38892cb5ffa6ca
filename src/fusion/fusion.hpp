#ifndef POLYVIEW_FUSION_HPP
#define POLYVIEW_FUSION_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "details/common.hpp"
#include "details/mean.hpp"
#include "details/poe.hpp"

namespace Polyview::Fusion {
    using MeanOptions = Details::MeanOptions;
    using MeanDescriptor = Details::MeanDescriptor;

    using ProductOfExpertsOptions = Details::ProductOfExpertsOptions;
    using ProductOfExpertsDescriptor = Details::ProductOfExpertsDescriptor;

    using Descriptor = std::variant<MeanDescriptor, ProductOfExpertsDescriptor>;

    enum class JoinType { Mean, PoE };

    [[nodiscard]] constexpr auto Mean(const MeanOptions& options = {}) noexcept -> MeanDescriptor {
        return {options};
    }

    [[nodiscard]] constexpr auto ProductOfExperts(const ProductOfExpertsOptions& options = {}) noexcept -> ProductOfExpertsDescriptor {
        return {options};
    }

    [[nodiscard]] constexpr std::string_view to_string(JoinType type) noexcept {
        return type == JoinType::PoE ? "PoE" : "Mean";
    }

    [[nodiscard]] inline JoinType parse_join_type(std::string_view name) {
        if (name == "Mean") {
            return JoinType::Mean;
        }
        if (name == "PoE") {
            return JoinType::PoE;
        }
        throw std::invalid_argument("Unknown join type '" + std::string(name) + "'. Expected \"Mean\" or \"PoE\".");
    }

    [[nodiscard]] inline Descriptor make_descriptor(JoinType type) {
        switch (type) {
            case JoinType::Mean:
                return Mean();
            case JoinType::PoE:
                return ProductOfExperts();
        }
        throw std::invalid_argument("Unsupported join type value.");
    }

    [[nodiscard]] inline std::string_view name(const Descriptor& descriptor) noexcept {
        return std::holds_alternative<ProductOfExpertsDescriptor>(descriptor) ? "PoE" : "Mean";
    }

    // mu, logvar: [n_views, batch, z_dim] -> ([batch, z_dim], [batch, z_dim])
    [[nodiscard]] inline std::pair<torch::Tensor, torch::Tensor> fuse(const Descriptor& descriptor,
                                                                      const torch::Tensor& mu,
                                                                      const torch::Tensor& logvar) {
        return std::visit([&](const auto& concrete) { return Details::fuse(concrete, mu, logvar); }, descriptor);
    }

    [[nodiscard]] inline std::pair<torch::Tensor, torch::Tensor> fuse(const Descriptor& descriptor,
                                                                      const std::vector<torch::Tensor>& mu,
                                                                      const std::vector<torch::Tensor>& logvar) {
        if (mu.empty() || mu.size() != logvar.size()) {
            throw std::invalid_argument("Fusion requires one (mu, logvar) pair per view.");
        }
        return fuse(descriptor, torch::stack(mu), torch::stack(logvar));
    }
}

#endif // POLYVIEW_FUSION_HPP
