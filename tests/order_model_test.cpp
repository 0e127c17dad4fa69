#include "order_model.hpp"
#include <cmath>
#include <gtest/gtest.h>
#include <limits>
#include <sstream>
#include <stdexcept>

using namespace rate_order;

TEST(OrderModelTest, EnumeratedInEvaluationOrder) {
    const auto &models = order_models();
    ASSERT_EQ(models.size(), 3u);
    EXPECT_EQ(models[0].order, ReactionOrder::Zeroth);
    EXPECT_EQ(models[1].order, ReactionOrder::First);
    EXPECT_EQ(models[2].order, ReactionOrder::Second);
    for (std::size_t i = 0; i < models.size(); ++i) {
        EXPECT_EQ(models[i].n, static_cast<int>(i));
        EXPECT_EQ(order_index(models[i].order), i);
    }
}

TEST(OrderModelTest, Labels) {
    EXPECT_EQ(order_model(ReactionOrder::Zeroth).linear_label, "[A] vs t");
    EXPECT_EQ(order_model(ReactionOrder::First).linear_label, "ln[A] vs t");
    EXPECT_EQ(order_model(ReactionOrder::Second).linear_label, "1/[A] vs t");
    EXPECT_EQ(order_model(ReactionOrder::First).rate_units, "1/s");

    std::ostringstream ss;
    ss << ReactionOrder::Second;
    EXPECT_EQ(ss.str(), "Second Order");
}

TEST(OrderModelTest, Transforms) {
    EXPECT_DOUBLE_EQ(order_model(ReactionOrder::Zeroth).transform(0.25), 0.25);
    EXPECT_DOUBLE_EQ(order_model(ReactionOrder::First).transform(std::exp(-2.0)), -2.0);
    EXPECT_DOUBLE_EQ(order_model(ReactionOrder::Second).transform(0.25), 4.0);
}

TEST(OrderModelTest, DomainGuards) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const OrderModel &zeroth = order_model(ReactionOrder::Zeroth);
    const OrderModel &first = order_model(ReactionOrder::First);
    const OrderModel &second = order_model(ReactionOrder::Second);

    EXPECT_TRUE(zeroth.accepts(0.0));
    EXPECT_TRUE(zeroth.accepts(-0.5));
    EXPECT_FALSE(zeroth.accepts(nan));

    EXPECT_TRUE(first.accepts(1e-9));
    EXPECT_FALSE(first.accepts(0.0));
    EXPECT_FALSE(first.accepts(-1.0));
    EXPECT_FALSE(second.accepts(0.0));
    EXPECT_FALSE(second.accepts(std::numeric_limits<double>::infinity()));
}

TEST(OrderModelTest, RateConstantSignConvention) {
    EXPECT_DOUBLE_EQ(order_model(ReactionOrder::Zeroth).rate_constant(-0.03), 0.03);
    EXPECT_DOUBLE_EQ(order_model(ReactionOrder::First).rate_constant(-0.02), 0.02);
    EXPECT_DOUBLE_EQ(order_model(ReactionOrder::Second).rate_constant(0.2), 0.2);
}

TEST(OrderModelTest, TwoPointRateConstant) {
    // Defaults of the interactive calculator: [A]0 = 1.0 M, [A]t = 0.5 M, t = 10 s
    EXPECT_NEAR(two_point_rate_constant(ReactionOrder::Zeroth, 1.0, 0.5, 10.0), 0.05, 1e-12);
    EXPECT_NEAR(two_point_rate_constant(ReactionOrder::First, 1.0, 0.5, 10.0), std::log(2.0) / 10.0, 1e-12);
    EXPECT_NEAR(two_point_rate_constant(ReactionOrder::Second, 1.0, 0.5, 10.0), 0.1, 1e-12);

    // Zeroth order allows complete depletion
    EXPECT_NEAR(two_point_rate_constant(ReactionOrder::Zeroth, 1.0, 0.0, 4.0), 0.25, 1e-12);
}

TEST(OrderModelTest, TwoPointRateConstantRejectsInvalidInput) {
    EXPECT_THROW(two_point_rate_constant(ReactionOrder::First, 1.0, 0.0, 10.0), std::invalid_argument);
    EXPECT_THROW(two_point_rate_constant(ReactionOrder::Second, 1.0, 0.0, 10.0), std::invalid_argument);
    EXPECT_THROW(two_point_rate_constant(ReactionOrder::Zeroth, 1.0, 0.5, 0.0), std::invalid_argument);
    EXPECT_THROW(two_point_rate_constant(ReactionOrder::Zeroth, 0.0, 0.5, 1.0), std::invalid_argument);
    EXPECT_THROW(two_point_rate_constant(ReactionOrder::Zeroth, 1.0, -0.1, 1.0), std::invalid_argument);
}

TEST(OrderModelTest, IntegratedConcentration) {
    EXPECT_NEAR(integrated_concentration(ReactionOrder::Zeroth, 1.0, 0.05, 10.0), 0.5, 1e-12);
    EXPECT_EQ(integrated_concentration(ReactionOrder::Zeroth, 1.0, 0.05, 30.0), 0.0); // clipped
    EXPECT_NEAR(integrated_concentration(ReactionOrder::First, 1.0, std::log(2.0) / 10.0, 10.0), 0.5, 1e-12);
    EXPECT_NEAR(integrated_concentration(ReactionOrder::Second, 1.0, 0.1, 10.0), 0.5, 1e-12);
    EXPECT_THROW(integrated_concentration(ReactionOrder::First, 0.0, 0.1, 1.0), std::invalid_argument);
    EXPECT_THROW(integrated_concentration(ReactionOrder::First, 1.0, 0.1, -1.0), std::invalid_argument);
}

TEST(OrderModelTest, TwoPointInvertsIntegratedLaw) {
    for (const auto &model : order_models()) {
        const double a0 = 0.8;
        const double k = 0.015;
        const double t = 25.0;
        const double at = integrated_concentration(model.order, a0, k, t);
        EXPECT_NEAR(two_point_rate_constant(model.order, a0, at, t), k, 1e-12) << model.name;
    }
}

TEST(OrderModelTest, DivergingSecondOrderConcentrationRejected) {
    EXPECT_NEAR(integrated_concentration(ReactionOrder::Second, 1.0, -0.1, 5.0), 2.0, 1e-12);
    EXPECT_THROW(integrated_concentration(ReactionOrder::Second, 1.0, -0.1, 10.0), std::invalid_argument);
    EXPECT_THROW(integrated_concentration(ReactionOrder::Second, 1.0, -0.1, 15.0), std::invalid_argument);
}
