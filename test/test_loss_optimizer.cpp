#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

#include <torch/torch.h>

#include "../include/Polyview.h"

namespace {
    class LossOptimizerTest : public ::testing::Test {
    protected:
        void SetUp() override { torch::manual_seed(5); }
    };
}

TEST_F(LossOptimizerTest, AssembleWeightsOnlyTheKlTerm) {
    const auto kl = torch::tensor(2.5);
    const auto ll = torch::tensor(-4.0);
    const auto terms = Polyview::Loss::assemble(kl, ll, 0.5);

    EXPECT_DOUBLE_EQ(terms.total.item<double>(), 0.5 * 2.5 + 4.0);
    EXPECT_DOUBLE_EQ(terms.kl.item<double>(), 2.5);
    EXPECT_DOUBLE_EQ(terms.ll.item<double>(), -4.0);

    const auto map = terms.as_map();
    ASSERT_EQ(map.size(), 3u);
    EXPECT_TRUE(map.count("total") && map.count("kl") && map.count("ll"));
}

TEST_F(LossOptimizerTest, AssembleRejectsNegativeBetaAndMissingTerms) {
    EXPECT_THROW((void)Polyview::Loss::assemble(torch::tensor(1.0), torch::tensor(1.0), -1.0), std::invalid_argument);
    EXPECT_THROW((void)Polyview::Loss::assemble(torch::Tensor{}, torch::tensor(1.0), 1.0), std::invalid_argument);
}

TEST_F(LossOptimizerTest, ReductionSumsFeaturesThenAveragesBatch) {
    const auto elementwise = torch::tensor({{1.0, 2.0}, {3.0, 4.0}});
    EXPECT_DOUBLE_EQ(Polyview::Loss::reduce_elementwise(elementwise).item<double>(), 5.0);
    EXPECT_DOUBLE_EQ(Polyview::Loss::reduce_elementwise(elementwise, Polyview::Loss::Reduction::Sum).item<double>(), 10.0);
    EXPECT_THROW((void)Polyview::Loss::reduce_elementwise(torch::ones({3})), std::invalid_argument);
}

TEST_F(LossOptimizerTest, ReconstructionErrorIsSquaredErrorPerSample) {
    const auto x = torch::zeros({2, 3});
    const auto x_hat = torch::ones({2, 3});
    EXPECT_DOUBLE_EQ(Polyview::Loss::reconstruction_error(x, x_hat).item<double>(), 3.0);
    EXPECT_THROW((void)Polyview::Loss::reconstruction_error(x, torch::ones({2, 4})), std::invalid_argument);
}

TEST_F(LossOptimizerTest, PartitionRejectsDuplicatedAndEmptyGroups) {
    const auto a = torch::zeros({2}, torch::requires_grad());
    const auto b = torch::zeros({3}, torch::requires_grad());

    Polyview::Optimizer::Partition partition;
    partition.add("first", {a});
    EXPECT_THROW(partition.add("second", {b, a}), std::invalid_argument);
    EXPECT_THROW(partition.add("empty", {}), std::invalid_argument);
    EXPECT_THROW(partition.add("undefined", {torch::Tensor{}}), std::invalid_argument);
}

TEST_F(LossOptimizerTest, PartitionSkipsFrozenTensors) {
    const auto trainable = torch::zeros({2}, torch::requires_grad());
    const auto frozen = torch::zeros({3});

    Polyview::Optimizer::Partition partition;
    partition.add("mixed", {trainable, frozen});
    ASSERT_EQ(partition.groups().front().parameters.size(), 1u);
    EXPECT_FALSE(partition.contains(frozen));
    EXPECT_NO_THROW(partition.verify_covers({trainable, frozen}));
    EXPECT_THROW(partition.add("frozen", {torch::ones({2})}), std::invalid_argument);
}

TEST_F(LossOptimizerTest, RejectedGroupLeavesThePartitionUnchanged) {
    const auto a = torch::zeros({2}, torch::requires_grad());
    const auto b = torch::zeros({3}, torch::requires_grad());

    Polyview::Optimizer::Partition partition;
    EXPECT_THROW(partition.add("twice", {b, b}), std::invalid_argument);
    EXPECT_FALSE(partition.contains(b));
    partition.add("first", {a, b});
    EXPECT_NO_THROW(partition.verify_covers({a, b}));
}

TEST_F(LossOptimizerTest, PartitionCoverageIsVerified) {
    const auto a = torch::zeros({2}, torch::requires_grad());
    const auto b = torch::zeros({3}, torch::requires_grad());

    Polyview::Optimizer::Partition partition;
    partition.add("first", {a});
    EXPECT_THROW(partition.verify_covers({a, b}), std::logic_error);
    partition.add("second", {b});
    EXPECT_NO_THROW(partition.verify_covers({a, b}));
    EXPECT_THROW(partition.verify_covers({a}), std::logic_error);
}

TEST_F(LossOptimizerTest, PerGroupBuildsOneOptimizerPerGroup) {
    Polyview::Optimizer::Partition partition(Polyview::Optimizer::PartitionMode::PerGroup);
    partition.add("first", {torch::zeros({2}, torch::requires_grad())});
    partition.add("second", {torch::zeros({3}, torch::requires_grad())});

    const auto optimizers = partition.build(Polyview::Optimizer::Adam({.learning_rate = 1e-3}));
    ASSERT_EQ(optimizers.size(), 2u);
    EXPECT_EQ(partition.optimizer_count(), 2u);
    EXPECT_EQ(optimizers[0]->param_groups().size(), 1u);
}

TEST_F(LossOptimizerTest, GroupedBuildsOneOptimizerWithParamGroups) {
    Polyview::Optimizer::Partition partition(Polyview::Optimizer::PartitionMode::Grouped);
    partition.add("first", {torch::zeros({2}, torch::requires_grad())});
    partition.add("second", {torch::zeros({3}, torch::requires_grad())});

    const Polyview::Optimizer::Descriptor descriptor = Polyview::Optimizer::SGD({.learning_rate = 0.1});
    const auto optimizers = partition.build(descriptor);
    ASSERT_EQ(optimizers.size(), 1u);
    EXPECT_EQ(optimizers[0]->param_groups().size(), 2u);
}

TEST_F(LossOptimizerTest, OptimizerStepMovesParameters) {
    auto parameter = torch::ones({3}, torch::requires_grad());
    Polyview::Optimizer::Partition partition;
    partition.add("only", {parameter});

    auto optimizers = partition.build(Polyview::Optimizer::SGD({.learning_rate = 0.5}));
    optimizers.front()->zero_grad();
    parameter.sum().backward();
    optimizers.front()->step();
    EXPECT_TRUE(torch::allclose(parameter.detach(), torch::full({3}, 0.5)));
}

TEST_F(LossOptimizerTest, NesterovWithoutMomentumIsRejected) {
    Polyview::Optimizer::Partition partition;
    partition.add("only", {torch::ones({3}, torch::requires_grad())});
    EXPECT_THROW((void)partition.build(Polyview::Optimizer::SGD({.nesterov = true})), std::invalid_argument);
}
