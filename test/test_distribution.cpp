#include <gtest/gtest.h>

#include <cmath>
#include <stdexcept>

#include <torch/torch.h>

#include "../include/Polyview.h"

namespace {
    class DistributionTest : public ::testing::Test {
    protected:
        void SetUp() override { torch::manual_seed(7); }
    };
}

TEST_F(DistributionTest, RsampleIsStochasticAndMeanIsExact) {
    const auto mu = torch::randn({16, 3});
    const auto logvar = torch::zeros({16, 3});
    const auto posterior = Polyview::Distribution::Gaussian(mu, logvar);

    const auto first = posterior.rsample();
    const auto second = posterior.rsample();
    EXPECT_FALSE(torch::allclose(first, second));
    EXPECT_TRUE(torch::equal(posterior.mean(), mu));
    EXPECT_TRUE(torch::equal(posterior.sample(false), mu));
}

TEST_F(DistributionTest, RsampleCarriesGradientToParameters) {
    auto mu = torch::zeros({4, 2}, torch::requires_grad());
    auto logvar = torch::zeros({4, 2}, torch::requires_grad());
    const auto posterior = Polyview::Distribution::Gaussian(mu, logvar);

    posterior.rsample().sum().backward();
    ASSERT_TRUE(mu.grad().defined());
    ASSERT_TRUE(logvar.grad().defined());
    EXPECT_TRUE(torch::allclose(mu.grad(), torch::ones({4, 2})));
}

TEST_F(DistributionTest, KlAgainstStandardNormalIsZeroAtThePrior) {
    const auto posterior = Polyview::Distribution::Gaussian(torch::zeros({5, 4}), torch::zeros({5, 4}));
    EXPECT_TRUE(torch::allclose(posterior.kl_divergence(), torch::zeros({5, 4})));

    const auto prior = Polyview::Distribution::StandardNormal(posterior.loc());
    EXPECT_TRUE(torch::allclose(posterior.kl_divergence(prior), torch::zeros({5, 4})));
}

TEST_F(DistributionTest, ClosedFormKlMatchesGeneralFormula) {
    const auto mu = torch::randn({8, 3});
    const auto logvar = torch::randn({8, 3}) * 0.5;
    const auto posterior = Polyview::Distribution::Gaussian(mu, logvar);

    const auto general = posterior.kl_divergence(Polyview::Distribution::StandardNormal(mu));
    EXPECT_TRUE(torch::allclose(posterior.kl_divergence(), general, 1e-5, 1e-6));
    EXPECT_TRUE((posterior.kl_divergence() >= -1e-6).all().item<bool>());
}

TEST_F(DistributionTest, LogLikelihoodMatchesGaussianDensity) {
    const auto loc = torch::tensor({{0.0, 1.0}});
    const auto logvar = torch::tensor({{0.0, std::log(4.0)}});
    const auto likelihood = Polyview::Distribution::Gaussian(loc, logvar);

    const auto x = torch::tensor({{1.0, 1.0}});
    const auto log_prob = likelihood.log_likelihood(x);

    const double two_pi = 2.0 * 3.14159265358979323846;
    const double expected_first = -0.5 * std::log(two_pi) - 0.5;
    const double expected_second = -0.5 * std::log(two_pi * 4.0);
    EXPECT_NEAR(log_prob[0][0].item<double>(), expected_first, 1e-5);
    EXPECT_NEAR(log_prob[0][1].item<double>(), expected_second, 1e-5);
}

TEST_F(DistributionTest, LogLikelihoodBroadcastsSharedLogVariance) {
    const auto likelihood = Polyview::Distribution::Gaussian(torch::zeros({6, 4}), torch::zeros({1, 4}));
    const auto log_prob = likelihood.log_likelihood(torch::zeros({6, 4}));
    EXPECT_EQ(log_prob.sizes(), (std::vector<int64_t>{6, 4}));
}

TEST_F(DistributionTest, LogLikelihoodRejectsShapeMismatch) {
    const auto likelihood = Polyview::Distribution::Gaussian(torch::zeros({6, 4}), torch::zeros({1, 4}));
    EXPECT_THROW((void)likelihood.log_likelihood(torch::zeros({6, 5})), std::invalid_argument);
}

TEST_F(DistributionTest, SparseKlUsesVariationalDropoutApproximation) {
    const auto mu = torch::full({1, 1}, 1.0);
    const auto logvar = torch::full({1, 1}, 0.0);
    const auto posterior = Polyview::Distribution::Gaussian(mu, logvar);

    const Polyview::Distribution::SparseKLConstants constants{};
    const double log_alpha = 0.0 - std::log(1.0 + 1e-8);
    const double negative_kl = constants.k1 / (1.0 + std::exp(-(constants.k2 + constants.k3 * log_alpha)))
                             - 0.5 * std::log1p(std::exp(-log_alpha)) - constants.k1;
    EXPECT_NEAR(posterior.sparse_kl_divergence().item<double>(), -negative_kl, 1e-5);
}

TEST_F(DistributionTest, SparseKlDecreasesAsDropoutGrows) {
    const auto mu = torch::ones({1, 3});
    const auto logvar = torch::tensor({{-4.0, 0.0, 4.0}});
    const auto kl = Polyview::Distribution::Gaussian(mu, logvar).sparse_kl_divergence();
    EXPECT_GT(kl[0][0].item<double>(), kl[0][1].item<double>());
    EXPECT_GT(kl[0][1].item<double>(), kl[0][2].item<double>());
}

TEST_F(DistributionTest, UndefinedParametersAreRejected) {
    EXPECT_THROW(Polyview::Distribution::Normal(torch::Tensor{}, torch::zeros({1})), std::invalid_argument);
}
