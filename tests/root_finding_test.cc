// SPDX-License-Identifier: MIT
#include "tilgung/math/root_finding.hpp"
#include "tilgung/loan/annuity.hpp"
#include <gtest/gtest.h>
#include <cmath>

TEST(RootFindingConfigTest, DefaultValues) {
    tilgung::RootFindingConfig config;

    EXPECT_EQ(config.max_iter, 50u);
    EXPECT_DOUBLE_EQ(config.tolerance, 0.01);
    EXPECT_DOUBLE_EQ(config.lower_bound, 0.0001);
    EXPECT_DOUBLE_EQ(config.upper_bound, 0.30);
}

TEST(RootFindingConfigTest, CustomValues) {
    tilgung::RootFindingConfig config{
        .max_iter = 100,
        .tolerance = 1e-8,
        .lower_bound = 0.001,
        .upper_bound = 0.2
    };

    EXPECT_EQ(config.max_iter, 100u);
    EXPECT_DOUBLE_EQ(config.tolerance, 1e-8);
}

// ============================================================================
// Bisection Tests
// ============================================================================

TEST(BisectionTest, SquareRoot) {
    // Objective: x^2 - 2 = 0, root at x = sqrt(2)
    auto f = [](double x) { return x*x - 2.0; };

    tilgung::RootFindingConfig config{.max_iter = 100, .tolerance = 1e-9};

    auto result = tilgung::bisection_find_root(f, 0.0, 2.0, config);

    ASSERT_TRUE(result.converged);
    ASSERT_TRUE(result.root.has_value());
    EXPECT_NEAR(*result.root, std::sqrt(2.0), 1e-8);
    EXPECT_LT(result.final_error, 1e-9);
    EXPECT_FALSE(result.failure_reason.has_value());
}

TEST(BisectionTest, TranscendentalFunction) {
    // exp(x) - 3x = 0 has a root around x = 1.512 in [1, 2]
    auto f = [](double x) { return std::exp(x) - 3.0*x; };

    tilgung::RootFindingConfig config{.max_iter = 100, .tolerance = 1e-9};

    auto result = tilgung::bisection_find_root(f, 1.0, 2.0, config);

    ASSERT_TRUE(result.converged);
    double x = *result.root;
    EXPECT_NEAR(std::exp(x), 3.0*x, 1e-8);
}

TEST(BisectionTest, AnnuityRateInversion) {
    // 300,000 over 360 months at 3.5% costs about 1,347.13 per month
    const double payment = *tilgung::annuity_payment(300'000.0, 0.035 / 12.0, 360);
    auto residual = [payment](double annual) {
        return *tilgung::annuity_payment(300'000.0, annual / 12.0, 360) - payment;
    };

    tilgung::RootFindingConfig config{.tolerance = 1e-6};
    auto result = tilgung::bisection_find_root(residual, config.lower_bound,
                                               config.upper_bound, config);

    ASSERT_TRUE(result.converged);
    EXPECT_NEAR(*result.root, 0.035, 1e-6);
    EXPECT_LE(result.iterations, config.max_iter);
}

TEST(BisectionTest, RootNotBracketed) {
    auto f = [](double x) { return x + 10.0; };

    auto result = tilgung::bisection_find_root(f, 0.0, 1.0, tilgung::RootFindingConfig{});

    EXPECT_FALSE(result.converged);
    EXPECT_EQ(result.iterations, 0u);
    EXPECT_FALSE(result.root.has_value());
    ASSERT_TRUE(result.failure_reason.has_value());
    EXPECT_EQ(*result.failure_reason, "Root not bracketed");
}

TEST(BisectionTest, NonFiniteEndpoint) {
    auto f = [](double x) { return std::log(x); };

    auto result = tilgung::bisection_find_root(f, -1.0, 2.0, tilgung::RootFindingConfig{});

    EXPECT_FALSE(result.converged);
    EXPECT_TRUE(std::isnan(result.final_error));
}

TEST(BisectionTest, MaxIterationsReached) {
    auto f = [](double x) { return x - 0.123456789; };

    tilgung::RootFindingConfig config{.max_iter = 3, .tolerance = 1e-12};
    auto result = tilgung::bisection_find_root(f, 0.0, 1.0, config);

    EXPECT_FALSE(result.converged);
    EXPECT_EQ(result.iterations, 3u);
    ASSERT_TRUE(result.failure_reason.has_value());
    EXPECT_EQ(*result.failure_reason, "Maximum iterations reached");
}
