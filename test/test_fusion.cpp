#include <gtest/gtest.h>

#include <cmath>
#include <stdexcept>
#include <vector>

#include <torch/torch.h>

#include "../include/Polyview.h"

namespace {
    class FusionTest : public ::testing::Test {
    protected:
        void SetUp() override { torch::manual_seed(11); }
    };
}

TEST_F(FusionTest, MeanOfIdenticalPosteriorsReturnsThePosterior) {
    const auto mu = torch::randn({8, 3});
    const auto logvar = torch::randn({8, 3});

    for (const bool average_variance : {false, true}) {
        const Polyview::Fusion::Descriptor descriptor = Polyview::Fusion::Mean({.average_variance = average_variance});
        const auto [fused_mu, fused_logvar] = Polyview::Fusion::fuse(descriptor, std::vector<torch::Tensor>{mu, mu, mu},
                                                                     std::vector<torch::Tensor>{logvar, logvar, logvar});
        EXPECT_TRUE(torch::allclose(fused_mu, mu, 1e-5, 1e-6));
        EXPECT_TRUE(torch::allclose(fused_logvar, logvar, 1e-5, 1e-6));
    }
}

TEST_F(FusionTest, MeanAveragesLogVariancesByDefault) {
    const auto mu = torch::zeros({2, 1, 1});
    const auto logvar = torch::tensor({0.0, 2.0}).reshape({2, 1, 1});

    const auto [unused_mu, geometric] = Polyview::Fusion::fuse(Polyview::Fusion::Mean(), mu, logvar);
    EXPECT_NEAR(geometric.item<double>(), 1.0, 1e-6);

    const auto [unused, arithmetic] = Polyview::Fusion::fuse(Polyview::Fusion::Mean({.average_variance = true}), mu, logvar);
    EXPECT_NEAR(arithmetic.item<double>(), std::log((1.0 + std::exp(2.0)) / 2.0), 1e-5);
}

TEST_F(FusionTest, ProductOfExpertsShrinksSingleViewVariance) {
    const auto mu = torch::randn({1, 16, 4});
    const auto logvar = torch::randn({1, 16, 4});

    const auto [fused_mu, fused_logvar] = Polyview::Fusion::fuse(Polyview::Fusion::ProductOfExperts(), mu, logvar);
    EXPECT_TRUE((fused_logvar < logvar[0]).all().item<bool>());
    EXPECT_TRUE((fused_mu.abs() <= mu[0].abs() + 1e-6).all().item<bool>());
}

TEST_F(FusionTest, ProductOfExpertsMatchesPrecisionWeighting) {
    const auto mu = torch::tensor({1.0, 3.0}).reshape({2, 1, 1});
    const auto logvar = torch::tensor({0.0, std::log(0.5)}).reshape({2, 1, 1});

    const auto [with_prior_mu, with_prior_logvar] = Polyview::Fusion::fuse(Polyview::Fusion::ProductOfExperts(), mu, logvar);
    // precisions 1, 2 and the unit prior: total 4
    EXPECT_NEAR(with_prior_mu.item<double>(), (1.0 * 1.0 + 3.0 * 2.0) / 4.0, 1e-5);
    EXPECT_NEAR(with_prior_logvar.item<double>(), -std::log(4.0), 1e-5);

    const auto [plain_mu, plain_logvar] =
        Polyview::Fusion::fuse(Polyview::Fusion::ProductOfExperts({.prior_expert = false}), mu, logvar);
    EXPECT_NEAR(plain_mu.item<double>(), 7.0 / 3.0, 1e-5);
    EXPECT_NEAR(plain_logvar.item<double>(), -std::log(3.0), 1e-5);
}

TEST_F(FusionTest, ProductOfExpertsStaysFiniteForExtremeLogVariances) {
    const auto mu = torch::tensor({1.0f, 3.0f}).reshape({2, 1, 1});
    auto logvar = torch::tensor({100.0f, 0.0f}).reshape({2, 1, 1}).requires_grad_(true);

    const auto [fused_mu, fused_logvar] = Polyview::Fusion::fuse(Polyview::Fusion::ProductOfExperts(), mu, logvar);
    // The near-flat expert drops out: precision 1 plus the unit prior.
    EXPECT_NEAR(fused_mu.item<double>(), 1.5, 1e-5);
    EXPECT_NEAR(fused_logvar.item<double>(), -std::log(2.0), 1e-5);

    (fused_mu + fused_logvar).sum().backward();
    EXPECT_TRUE(torch::isfinite(logvar.grad()).all().item<bool>());

    auto sharp = torch::full({1, 1, 1}, -100.0f).requires_grad_(true);
    const auto [sharp_mu, sharp_logvar] = Polyview::Fusion::fuse(Polyview::Fusion::ProductOfExperts(), torch::ones({1, 1, 1}), sharp);
    EXPECT_TRUE(std::isfinite(sharp_logvar.item<double>()));
    EXPECT_NEAR(sharp_mu.item<double>(), 1.0, 1e-5);
    (sharp_mu + sharp_logvar).sum().backward();
    EXPECT_TRUE(torch::isfinite(sharp.grad()).all().item<bool>());
}

TEST_F(FusionTest, ProductOfExpertsRejectsNonPositiveEps) {
    EXPECT_THROW((void)Polyview::Fusion::fuse(Polyview::Fusion::ProductOfExperts({.eps = 0.0}), torch::zeros({2, 1, 1}),
                                              torch::zeros({2, 1, 1})),
                 std::invalid_argument);
}

TEST_F(FusionTest, JoinTypeNamesParseAndRoundTrip) {
    EXPECT_EQ(Polyview::Fusion::parse_join_type("Mean"), Polyview::Fusion::JoinType::Mean);
    EXPECT_EQ(Polyview::Fusion::parse_join_type("PoE"), Polyview::Fusion::JoinType::PoE);
    EXPECT_EQ(Polyview::Fusion::name(Polyview::Fusion::make_descriptor(Polyview::Fusion::JoinType::PoE)), "PoE");
    EXPECT_EQ(Polyview::Fusion::to_string(Polyview::Fusion::JoinType::Mean), "Mean");
}

TEST_F(FusionTest, UnknownJoinTypeIsRejected) {
    EXPECT_THROW((void)Polyview::Fusion::parse_join_type("Median"), std::invalid_argument);
    EXPECT_THROW((void)Polyview::Fusion::parse_join_type("poe"), std::invalid_argument);
}

TEST_F(FusionTest, MismatchedStacksAreRejected) {
    const Polyview::Fusion::Descriptor descriptor = Polyview::Fusion::ProductOfExperts();
    EXPECT_THROW((void)Polyview::Fusion::fuse(descriptor, torch::zeros({2, 4, 3}), torch::zeros({2, 4, 2})),
                 std::invalid_argument);
    EXPECT_THROW((void)Polyview::Fusion::fuse(descriptor, torch::zeros({4, 3}), torch::zeros({4, 3})),
                 std::invalid_argument);
    EXPECT_THROW((void)Polyview::Fusion::fuse(descriptor, std::vector<torch::Tensor>{}, std::vector<torch::Tensor>{}),
                 std::invalid_argument);
}
