#ifndef POLYVIEW_OPTIMIZER_PARTITION_HPP
#define POLYVIEW_OPTIMIZER_PARTITION_HPP

#include <cstddef>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../registry.hpp"

namespace Polyview::Optimizer::Details {

    struct ParameterGroup {
        std::string name{};
        std::vector<torch::Tensor> parameters{};
    };

    enum class PartitionMode {
        PerGroup, // one optimizer per group
        Grouped,  // one optimizer, one param group per entry
    };

    [[nodiscard]] constexpr std::string_view to_string(PartitionMode mode) noexcept {
        return mode == PartitionMode::Grouped ? "Grouped" : "PerGroup";
    }

    /*
     * Ordered, disjoint split of a model's trainable parameters.
     * ---------------------------------------------------------------------------
     *  - Fixed once the owning model is constructed.
     *  - A parameter tensor may appear in at most one group; add() rejects
     *    duplicates so no parameter is stepped twice per update.
     *  - Frozen tensors (requires_grad == false) are dropped by add(); a group
     *    left with nothing to train is an error.
     *  - verify_covers() checks the split against the full parameter list so
     *    that no trainable tensor is left without an optimizer.
     */
    class Partition {
    public:
        Partition() = default;
        explicit Partition(PartitionMode mode) : mode_(mode) {}

        void add(std::string name, const std::vector<torch::Tensor>& parameters) {
            std::vector<torch::Tensor> trainable;
            trainable.reserve(parameters.size());
            for (const auto& parameter : parameters) {
                if (!parameter.defined()) {
                    throw std::invalid_argument("Optimizer group '" + name + "' contains an undefined tensor.");
                }
                if (!parameter.requires_grad()) {
                    continue;
                }
                if (seen_.count(parameter.unsafeGetTensorImpl()) > 0 || contains_in(trainable, parameter)) {
                    throw std::invalid_argument("Optimizer group '" + name + "' repeats a parameter owned by another group.");
                }
                trainable.push_back(parameter);
            }
            if (trainable.empty()) {
                throw std::invalid_argument("Optimizer group '" + name + "' has no trainable parameters.");
            }
            for (const auto& parameter : trainable) {
                seen_.insert(parameter.unsafeGetTensorImpl());
            }
            groups_.push_back(ParameterGroup{std::move(name), std::move(trainable)});
        }

        [[nodiscard]] PartitionMode mode() const noexcept { return mode_; }
        [[nodiscard]] const std::vector<ParameterGroup>& groups() const noexcept { return groups_; }
        [[nodiscard]] bool empty() const noexcept { return groups_.empty(); }

        [[nodiscard]] std::size_t optimizer_count() const noexcept {
            if (groups_.empty()) {
                return 0;
            }
            return mode_ == PartitionMode::Grouped ? 1 : groups_.size();
        }

        [[nodiscard]] bool contains(const torch::Tensor& parameter) const {
            return seen_.count(parameter.unsafeGetTensorImpl()) > 0;
        }

        void verify_covers(const std::vector<torch::Tensor>& parameters) const {
            std::size_t trainable = 0;
            for (const auto& parameter : parameters) {
                if (!parameter.requires_grad()) {
                    continue;
                }
                ++trainable;
                if (!contains(parameter)) {
                    std::ostringstream message;
                    message << "Optimizer partition misses a trainable parameter of shape " << parameter.sizes() << '.';
                    throw std::logic_error(message.str());
                }
            }
            if (trainable != seen_.size()) {
                throw std::logic_error("Optimizer partition holds tensors that are not trainable parameters of the model.");
            }
        }

        template <class DescriptorT>
        [[nodiscard]] std::vector<std::unique_ptr<torch::optim::Optimizer>> build(const DescriptorT& descriptor) const {
            std::vector<std::unique_ptr<torch::optim::Optimizer>> optimizers;
            if (groups_.empty()) {
                return optimizers;
            }

            if (mode_ == PartitionMode::Grouped) {
                std::vector<torch::optim::OptimizerParamGroup> param_groups;
                param_groups.reserve(groups_.size());
                for (const auto& group : groups_) {
                    param_groups.emplace_back(group.parameters);
                }
                optimizers.push_back(build_optimizer(std::move(param_groups), descriptor));
                return optimizers;
            }

            optimizers.reserve(groups_.size());
            for (const auto& group : groups_) {
                optimizers.push_back(build_optimizer(group.parameters, descriptor));
            }
            return optimizers;
        }

    private:
        [[nodiscard]] static bool contains_in(const std::vector<torch::Tensor>& group, const torch::Tensor& parameter) {
            for (const auto& held : group) {
                if (held.unsafeGetTensorImpl() == parameter.unsafeGetTensorImpl()) {
                    return true;
                }
            }
            return false;
        }

        PartitionMode mode_{PartitionMode::PerGroup};
        std::vector<ParameterGroup> groups_{};
        std::unordered_set<const void*> seen_{};
    };
}

#endif // POLYVIEW_OPTIMIZER_PARTITION_HPP
