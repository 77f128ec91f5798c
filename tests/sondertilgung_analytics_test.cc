// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "tilgung/analytics/sondertilgung_analytics.hpp"
#include "tilgung/loan/loan_calculations.hpp"
#include <vector>

using namespace tilgung;

namespace {

LoanConfiguration make_config(double amount, double rate, int64_t months) {
    auto config = LoanConfiguration::with_computed_payment(*Money::from_major(amount),
                                                           *InterestRate::create(rate),
                                                           *MonthCount::create(months));
    EXPECT_TRUE(config.has_value());
    return *config;
}

ExtraPaymentPlan make_plan(std::vector<std::pair<int64_t, double>> extras) {
    std::vector<ExtraPayment> payments;
    for (auto [month, amount] : extras) {
        payments.push_back(*ExtraPayment::create(month, amount));
    }
    auto plan = ExtraPaymentPlan::create(std::nullopt, payments);
    EXPECT_TRUE(plan.has_value());
    return *plan;
}

}  // namespace

// ===========================================================================
// Impact
// ===========================================================================

TEST(SondertilgungImpactTest, SingleExtraPayment) {
    auto config = make_config(300'000.0, 3.5, 360);
    auto impact = sondertilgung_impact(config, make_plan({{12, 10'000.0}}));
    ASSERT_TRUE(impact.has_value());

    EXPECT_NEAR(impact->original_total_interest.to_major(), 184'968.26, 0.01);
    EXPECT_NEAR(impact->interest_saved.to_major(), 16'801.18, 0.05);
    EXPECT_EQ(impact->interest_saved.cents(),
              impact->original_total_interest.cents() - impact->new_total_interest.cents());
    EXPECT_EQ(impact->original_term.value(), 360);
    EXPECT_EQ(impact->new_term.value(), 341);
    EXPECT_EQ(impact->term_reduction_months, 19);
    EXPECT_EQ(impact->total_extra_payments.cents(), 1'000'000);
    EXPECT_NEAR(impact->effective_interest_rate, 168.0, 0.1);
}

TEST(SondertilgungImpactTest, EmptyPlanHasNoEffect) {
    auto impact = sondertilgung_impact(make_config(100'000.0, 5.6, 84), ExtraPaymentPlan::none());
    ASSERT_TRUE(impact.has_value());
    EXPECT_TRUE(impact->interest_saved.is_zero());
    EXPECT_EQ(impact->term_reduction_months, 0);
    EXPECT_TRUE(impact->total_extra_payments.is_zero());
    EXPECT_DOUBLE_EQ(impact->effective_interest_rate, 0.0);
}

TEST(SondertilgungImpactTest, ZeroRateSavesNothing) {
    auto impact = sondertilgung_impact(make_config(60'000.0, 0.0, 60),
                                       make_plan({{12, 10'000.0}}));
    ASSERT_TRUE(impact.has_value());
    EXPECT_TRUE(impact->interest_saved.is_zero());
    EXPECT_EQ(impact->term_reduction_months, 10);
    EXPECT_DOUBLE_EQ(impact->effective_interest_rate, 0.0);
}

// ===========================================================================
// Optimal extra payment
// ===========================================================================

TEST(OptimalExtraPaymentTest, CappedAtMaximum) {
    auto config = make_config(100'000.0, 5.6, 84);
    auto amount = optimal_extra_payment(config, *PaymentMonth::create(13),
                                        *Money::from_major(20'000.0));
    ASSERT_TRUE(amount.has_value());
    EXPECT_EQ(amount->cents(), 2'000'000);
}

TEST(OptimalExtraPaymentTest, CappedAtRemainingBalance) {
    auto config = make_config(100'000.0, 5.6, 84);
    auto balance = remaining_balance(config, 79);
    ASSERT_TRUE(balance.has_value());

    auto amount = optimal_extra_payment(config, *PaymentMonth::create(80),
                                        *Money::from_major(50'000.0));
    ASSERT_TRUE(amount.has_value());
    EXPECT_EQ(*amount, *balance);
}

TEST(OptimalExtraPaymentTest, AfterPayoffIsZero) {
    auto amount = optimal_extra_payment(make_config(10'000.0, 3.0, 12),
                                        *PaymentMonth::create(24), *Money::from_major(1'000.0));
    ASSERT_TRUE(amount.has_value());
    EXPECT_TRUE(amount->is_zero());
}

// ===========================================================================
// Strategy comparison
// ===========================================================================

TEST(CompareStrategiesTest, RankedByInterestSaved) {
    auto config = make_config(300'000.0, 3.5, 360);
    std::vector<ExtraPaymentPlan> plans = {
        make_plan({{120, 10'000.0}}),
        make_plan({{12, 10'000.0}}),
        ExtraPaymentPlan::none(),
        make_plan({{12, 5'000.0}, {24, 5'000.0}})
    };

    auto ranked = compare_strategies(config, plans);
    ASSERT_TRUE(ranked.has_value());
    ASSERT_EQ(ranked->size(), 4u);
    EXPECT_EQ((*ranked)[0].plan_index, 1u);
    EXPECT_EQ((*ranked)[1].plan_index, 3u);
    EXPECT_EQ((*ranked)[2].plan_index, 0u);
    EXPECT_EQ((*ranked)[3].plan_index, 2u);

    for (size_t i = 1; i < ranked->size(); ++i) {
        EXPECT_GE((*ranked)[i - 1].impact.interest_saved, (*ranked)[i].impact.interest_saved);
    }
}

TEST(CompareStrategiesTest, TiesKeepInputOrder) {
    auto config = make_config(100'000.0, 3.0, 120);
    std::vector<ExtraPaymentPlan> plans = {ExtraPaymentPlan::none(), ExtraPaymentPlan::none()};

    auto ranked = compare_strategies(config, plans);
    ASSERT_TRUE(ranked.has_value());
    EXPECT_EQ((*ranked)[0].plan_index, 0u);
    EXPECT_EQ((*ranked)[1].plan_index, 1u);
}

TEST(CompareStrategiesTest, EmptyInput) {
    auto ranked = compare_strategies(make_config(100'000.0, 3.0, 120), {});
    ASSERT_TRUE(ranked.has_value());
    EXPECT_TRUE(ranked->empty());
}

// ===========================================================================
// Sensitivity and payoff
// ===========================================================================

TEST(InterestSensitivityTest, SavingsGrowWithRate) {
    auto config = make_config(300'000.0, 3.5, 360);
    auto result = interest_sensitivity(config, *Money::from_major(10'000.0),
                                       *PaymentMonth::create(12));
    ASSERT_TRUE(result.has_value());

    EXPECT_LT(result->low_rate_savings, result->base_savings);
    EXPECT_LT(result->base_savings, result->high_rate_savings);
    EXPECT_NEAR(result->base_savings.to_major(), 16'801.18, 0.05);
    EXPECT_NEAR(result->low_rate_savings.to_major(), 10'287.46, 0.05);
    EXPECT_NEAR(result->high_rate_savings.to_major(), 25'277.80, 0.05);
    EXPECT_NEAR(result->sensitivity, 44.6, 0.1);
}

TEST(InterestSensitivityTest, LowRateFloor) {
    // 0.5% - 1 point is floored at 0.1%
    auto config = make_config(300'000.0, 0.5, 360);
    auto result = interest_sensitivity(config, *Money::from_major(10'000.0),
                                       *PaymentMonth::create(12));
    ASSERT_TRUE(result.has_value());
    EXPECT_LT(result->low_rate_savings, result->base_savings);
}

TEST(InterestSensitivityTest, InvalidAmountRejected) {
    auto result = interest_sensitivity(make_config(300'000.0, 3.5, 360),
                                       *Money::from_major(0.5), *PaymentMonth::create(12));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, AnalyticsErrorCode::InvalidAdjustment);
}

TEST(PayoffMonthTest, WithAndWithoutPlan) {
    auto config = make_config(300'000.0, 3.5, 360);

    auto base = payoff_month(config, ExtraPaymentPlan::none());
    ASSERT_TRUE(base.has_value());
    EXPECT_EQ(base->value(), 360);

    auto early = payoff_month(config, make_plan({{12, 20'000.0}}));
    ASSERT_TRUE(early.has_value());
    EXPECT_EQ(early->value(), 322);
}
