#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "../include/Polyview.h"

TEST(ConfigTest, DefaultsMatchDocumentedValues) {
    const Polyview::ModelOptions options{};
    EXPECT_EQ(options.z_dim, 1);
    EXPECT_DOUBLE_EQ(options.learning_rate, 0.002);
    EXPECT_DOUBLE_EQ(options.beta, 1.0);
    EXPECT_DOUBLE_EQ(options.threshold, 0.0);
    EXPECT_FALSE(options.non_linear);
    EXPECT_EQ(options.join_type, Polyview::Fusion::JoinType::Mean);
    EXPECT_EQ(options.shared_input, Polyview::SharedInput::FirstView);
    EXPECT_TRUE(options.cross_reconstruction);
    EXPECT_FALSE(options.optimizer.has_value());
}

TEST(ConfigTest, OverridesWriteRecognisedKeys) {
    Polyview::ModelOptions options{};
    Polyview::Config::apply_overrides(options, {
        {"input_dims", std::vector<std::int64_t>{10, 15}},
        {"z_dim", std::int64_t{3}},
        {"hidden_layer_dims", std::vector<std::int64_t>{32, 16}},
        {"non_linear", true},
        {"activation", std::string{"Tanh"}},
        {"learning_rate", 0.01},
        {"beta", std::int64_t{2}},
        {"threshold", 0.2},
        {"join_type", std::string{"PoE"}},
        {"private", true},
        {"shared_input", std::string{"AllViews"}},
        {"cross_reconstruction", false},
    });

    EXPECT_EQ(options.input_dims, (std::vector<std::int64_t>{10, 15}));
    EXPECT_EQ(options.z_dim, 3);
    EXPECT_EQ(options.hidden_layer_dims, (std::vector<std::int64_t>{32, 16}));
    EXPECT_TRUE(options.non_linear);
    EXPECT_EQ(options.activation.type, Polyview::Activation::Type::Tanh);
    EXPECT_DOUBLE_EQ(options.learning_rate, 0.01);
    EXPECT_DOUBLE_EQ(options.beta, 2.0);
    EXPECT_DOUBLE_EQ(options.threshold, 0.2);
    EXPECT_EQ(options.join_type, Polyview::Fusion::JoinType::PoE);
    EXPECT_TRUE(options.private_latent);
    EXPECT_EQ(options.shared_input, Polyview::SharedInput::AllViews);
    EXPECT_FALSE(options.cross_reconstruction);
    EXPECT_NO_THROW(Polyview::Config::validate(options));
}

TEST(ConfigTest, UnknownKeysAreRejected) {
    Polyview::ModelOptions options{};
    EXPECT_THROW(Polyview::Config::apply_override(options, "SNP_model", true), std::invalid_argument);
    EXPECT_THROW(Polyview::Config::apply_override(options, "zdim", std::int64_t{2}), std::invalid_argument);
}

TEST(ConfigTest, WronglyTypedValuesAreRejected) {
    Polyview::ModelOptions options{};
    EXPECT_THROW(Polyview::Config::apply_override(options, "z_dim", 2.5), std::invalid_argument);
    EXPECT_THROW(Polyview::Config::apply_override(options, "non_linear", std::int64_t{1}), std::invalid_argument);
    EXPECT_THROW(Polyview::Config::apply_override(options, "input_dims", std::int64_t{10}), std::invalid_argument);
    EXPECT_THROW(Polyview::Config::apply_override(options, "join_type", std::string{"Max"}), std::invalid_argument);
    EXPECT_THROW(Polyview::Config::apply_override(options, "shared_input", std::string{"LastView"}), std::invalid_argument);
    EXPECT_THROW(Polyview::Config::apply_override(options, "activation", std::string{"Swish"}), std::invalid_argument);
}

TEST(ConfigTest, ValidationRejectsOutOfRangeSettings) {
    const auto valid = [] {
        Polyview::ModelOptions options{};
        options.input_dims = {4, 6};
        options.z_dim = 2;
        return options;
    };
    EXPECT_NO_THROW(Polyview::Config::validate(valid()));

    auto options = valid();
    options.input_dims.clear();
    EXPECT_THROW(Polyview::Config::validate(options), std::invalid_argument);

    options = valid();
    options.input_dims = {4, 0};
    EXPECT_THROW(Polyview::Config::validate(options), std::invalid_argument);

    options = valid();
    options.z_dim = 0;
    EXPECT_THROW(Polyview::Config::validate(options), std::invalid_argument);

    options = valid();
    options.hidden_layer_dims = {8, -1};
    EXPECT_THROW(Polyview::Config::validate(options), std::invalid_argument);

    options = valid();
    options.learning_rate = 0.0;
    EXPECT_THROW(Polyview::Config::validate(options), std::invalid_argument);

    options = valid();
    options.beta = -0.5;
    EXPECT_THROW(Polyview::Config::validate(options), std::invalid_argument);

    options = valid();
    options.beta = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(Polyview::Config::validate(options), std::invalid_argument);

    options = valid();
    options.threshold = 1.5;
    EXPECT_THROW(Polyview::Config::validate(options), std::invalid_argument);

    options = valid();
    options.logging = Polyview::LogOptions{.monitor = true, .stream = nullptr};
    EXPECT_THROW(Polyview::Config::validate(options), std::invalid_argument);
}

TEST(ConfigTest, EnumNamesRoundTrip) {
    EXPECT_EQ(Polyview::Config::parse_shared_input(Polyview::to_string(Polyview::SharedInput::AllViews)),
              Polyview::SharedInput::AllViews);
    EXPECT_EQ(Polyview::Config::parse_activation("GeLU").type, Polyview::Activation::Type::GeLU);
}
