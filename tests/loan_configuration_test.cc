// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "tilgung/loan/loan_configuration.hpp"
#include "tilgung/loan/monthly_payment.hpp"
#include <type_traits>

using namespace tilgung;

namespace {

LoanConfigurationInput valid_input() {
    return LoanConfigurationInput{
        .amount = 100'000.0,
        .annual_rate = 5.6,
        .term_in_months = 84,
        .term_in_years = std::nullopt,
        .monthly_payment = 1'441.76
    };
}

}  // namespace

// ===========================================================================
// create()
// ===========================================================================

TEST(LoanConfigurationTest, CreateConsistent) {
    auto config = LoanConfiguration::create(*Money::from_major(100'000.0),
                                            *InterestRate::create(5.6),
                                            *MonthCount::create(84),
                                            *Money::from_major(1'441.76));
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->amount().cents(), 10'000'000);
    EXPECT_DOUBLE_EQ(config->annual_rate().percent(), 5.6);
    EXPECT_EQ(config->term().value(), 84);
    EXPECT_EQ(config->monthly_payment().cents(), 144'176);
}

TEST(LoanConfigurationTest, PaymentWithinOneEuroAccepted) {
    auto config = LoanConfiguration::create(*Money::from_major(100'000.0),
                                            *InterestRate::create(5.6),
                                            *MonthCount::create(84),
                                            *Money::from_major(1'442.70));
    EXPECT_TRUE(config.has_value());
}

TEST(LoanConfigurationTest, InconsistentPaymentRejected) {
    auto config = LoanConfiguration::create(*Money::from_major(100'000.0),
                                            *InterestRate::create(5.6),
                                            *MonthCount::create(84),
                                            *Money::from_major(1'500.00));
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ValidationErrorCode::InconsistentParameters);
    EXPECT_DOUBLE_EQ(config.error().value, 1'500.00);
}

TEST(LoanConfigurationTest, ZeroRateUsesCentTolerance) {
    auto amount = *Money::from_major(60'000.0);
    auto rate = *InterestRate::create(0.0);
    auto term = *MonthCount::create(60);

    EXPECT_TRUE(LoanConfiguration::create(amount, rate, term, *Money::from_major(1'000.00)).has_value());
    EXPECT_TRUE(LoanConfiguration::create(amount, rate, term, *Money::from_major(1'000.01)).has_value());

    auto off = LoanConfiguration::create(amount, rate, term, *Money::from_major(1'000.50));
    ASSERT_FALSE(off.has_value());
    EXPECT_EQ(off.error().code, ValidationErrorCode::InconsistentParameters);
}

TEST(LoanConfigurationTest, ZeroAmountRejected) {
    auto config = LoanConfiguration::create(Money::zero(), *InterestRate::create(3.0),
                                            *MonthCount::create(120), *Money::from_major(100.0));
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ValidationErrorCode::InvalidLoanAmount);
}

TEST(LoanConfigurationTest, ZeroPaymentRejected) {
    auto config = LoanConfiguration::create(*Money::from_major(10'000.0), *InterestRate::create(3.0),
                                            *MonthCount::create(120), Money::zero());
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ValidationErrorCode::InvalidMonthlyPayment);
}

TEST(LoanConfigurationTest, CustomPrecisionTightensTolerance) {
    PrecisionConfig strict{.payment_tolerance = 0.001};
    auto config = LoanConfiguration::create(*Money::from_major(100'000.0),
                                            *InterestRate::create(5.6),
                                            *MonthCount::create(84),
                                            *Money::from_major(1'441.80), strict);
    EXPECT_FALSE(config.has_value());
}

// ===========================================================================
// from_input()
// ===========================================================================

TEST(LoanConfigurationInputTest, ValidInput) {
    auto config = LoanConfiguration::from_input(valid_input());
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->term().value(), 84);
}

TEST(LoanConfigurationInputTest, TermInYears) {
    auto input = valid_input();
    input.term_in_months = std::nullopt;
    input.term_in_years = 7.0;
    auto config = LoanConfiguration::from_input(input);
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->term().value(), 84);
}

TEST(LoanConfigurationInputTest, MonthsWinOverYears) {
    auto input = valid_input();
    input.term_in_years = 30.0;
    auto config = LoanConfiguration::from_input(input);
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->term().value(), 84);
}

TEST(LoanConfigurationInputTest, MissingFieldRejected) {
    auto input = valid_input();
    input.annual_rate = std::nullopt;
    auto config = LoanConfiguration::from_input(input);
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ValidationErrorCode::InconsistentParameters);

    auto no_term = valid_input();
    no_term.term_in_months = std::nullopt;
    EXPECT_FALSE(LoanConfiguration::from_input(no_term).has_value());
}

TEST(LoanConfigurationInputTest, AmountBounds) {
    auto small = valid_input();
    small.amount = 999.0;
    auto config = LoanConfiguration::from_input(small);
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ValidationErrorCode::InvalidLoanAmount);

    auto large = valid_input();
    large.amount = 10'000'001.0;
    EXPECT_FALSE(LoanConfiguration::from_input(large).has_value());
}

TEST(LoanConfigurationInputTest, InvalidRateAndTerm) {
    auto rate = valid_input();
    rate.annual_rate = 30.0;
    auto bad_rate = LoanConfiguration::from_input(rate);
    ASSERT_FALSE(bad_rate.has_value());
    EXPECT_EQ(bad_rate.error().code, ValidationErrorCode::InvalidInterestRate);

    auto term = valid_input();
    term.term_in_months = 600;
    auto bad_term = LoanConfiguration::from_input(term);
    ASSERT_FALSE(bad_term.has_value());
    EXPECT_EQ(bad_term.error().code, ValidationErrorCode::InvalidTerm);
}

// ===========================================================================
// with_computed_payment() and comparison
// ===========================================================================

TEST(LoanConfigurationTest, WithComputedPayment) {
    auto config = LoanConfiguration::with_computed_payment(*Money::from_major(15'000.0),
                                                           *InterestRate::create(8.0),
                                                           *MonthCount::create(120));
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->monthly_payment().cents(), 18'199);
}

TEST(LoanConfigurationTest, CompareConfigurations) {
    auto a = *LoanConfiguration::with_computed_payment(*Money::from_major(300'000.0),
                                                       *InterestRate::create(3.5),
                                                       *MonthCount::create(360));
    auto b = *LoanConfiguration::with_computed_payment(*Money::from_major(300'000.0),
                                                       *InterestRate::create(3.0),
                                                       *MonthCount::create(300));
    auto diff = compare_loan_configurations(a, b);
    EXPECT_DOUBLE_EQ(diff.amount_difference, 0.0);
    EXPECT_NEAR(diff.rate_difference, -0.5, 1e-12);
    EXPECT_EQ(diff.term_difference, -60);
    EXPECT_GT(diff.payment_difference, 0.0);
}

// ===========================================================================
// MonthlyPayment decomposition
// ===========================================================================

TEST(MonthlyPaymentTest, DecompositionWithinOneCent) {
    auto p = MonthlyPayment::create(*Money::from_cents(97'509), *Money::from_cents(46'667),
                                    *Money::from_cents(144'176));
    ASSERT_TRUE(p.has_value());

    auto off_by_one = MonthlyPayment::create(*Money::from_cents(97'509), *Money::from_cents(46'667),
                                             *Money::from_cents(144'175));
    EXPECT_TRUE(off_by_one.has_value());

    auto off_by_two = MonthlyPayment::create(*Money::from_cents(97'509), *Money::from_cents(46'667),
                                             *Money::from_cents(144'174));
    ASSERT_FALSE(off_by_two.has_value());
    EXPECT_EQ(off_by_two.error().code, ValidationErrorCode::InvalidDecomposition);
}

TEST(MonthlyPaymentTest, OnlyBuiltThroughFactories) {
    static_assert(!std::is_aggregate_v<MonthlyPayment>);
    static_assert(!std::is_constructible_v<MonthlyPayment, Money, Money, Money>);
    static_assert(std::is_copy_constructible_v<MonthlyPayment>);
}

TEST(MonthlyPaymentTest, FromSplit) {
    auto p = MonthlyPayment::from_split(*Money::from_cents(8'199), *Money::from_cents(10'000));
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->total().cents(), 18'199);
}
