// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "tilgung/amortization/extra_payment.hpp"
#include <type_traits>
#include <vector>

using namespace tilgung;

namespace {

ExtraPayment payment(int64_t month, double amount) {
    auto p = ExtraPayment::create(month, amount);
    EXPECT_TRUE(p.has_value());
    return *p;
}

Money euros(double amount) { return *Money::from_major(amount); }

}  // namespace

// ===========================================================================
// ExtraPayment
// ===========================================================================

TEST(ExtraPaymentTest, AmountBounds) {
    EXPECT_TRUE(ExtraPayment::create(1, 1.0).has_value());
    EXPECT_TRUE(ExtraPayment::create(1, 1'000'000.0).has_value());

    auto small = ExtraPayment::create(1, 0.99);
    ASSERT_FALSE(small.has_value());
    EXPECT_EQ(small.error().code, ValidationErrorCode::InvalidExtraPayment);

    auto large = ExtraPayment::create(1, 1'000'000.01);
    ASSERT_FALSE(large.has_value());
    EXPECT_EQ(large.error().code, ValidationErrorCode::InvalidExtraPayment);
}

TEST(ExtraPaymentTest, OnlyBuiltThroughFactory) {
    static_assert(!std::is_aggregate_v<ExtraPayment>);
    static_assert(!std::is_constructible_v<ExtraPayment, PaymentMonth, Money>);
    static_assert(std::is_copy_constructible_v<ExtraPayment>);
}

TEST(ExtraPaymentTest, InvalidMonth) {
    auto p = ExtraPayment::create(0, 500.0);
    ASSERT_FALSE(p.has_value());
    EXPECT_EQ(p.error().code, ValidationErrorCode::InvalidPaymentMonth);
}

TEST(ExtraPaymentTest, CombineSameMonth) {
    auto merged = combine(payment(12, 2'000.0), payment(12, 3'000.0));
    ASSERT_TRUE(merged.has_value());
    EXPECT_EQ(merged->month().value(), 12);
    EXPECT_EQ(merged->amount(), euros(5'000.0));
}

TEST(ExtraPaymentTest, CombineDifferentMonthsFails) {
    auto merged = combine(payment(12, 2'000.0), payment(24, 3'000.0));
    ASSERT_FALSE(merged.has_value());
    EXPECT_EQ(merged.error().code, ValidationErrorCode::MonthMismatch);
}

TEST(ExtraPaymentTest, CombinePastMaximumFails) {
    auto merged = combine(payment(12, 600'000.0), payment(12, 600'000.0));
    ASSERT_FALSE(merged.has_value());
    EXPECT_EQ(merged.error().code, ValidationErrorCode::InvalidExtraPayment);
}

TEST(ExtraPaymentTest, GroupByMonthSortsAndMerges) {
    std::vector<ExtraPayment> payments = {
        payment(24, 1'000.0), payment(12, 500.0), payment(24, 250.0), payment(6, 100.0)
    };
    auto grouped = group_by_month(payments);
    ASSERT_TRUE(grouped.has_value());
    ASSERT_EQ(grouped->size(), 3u);
    EXPECT_EQ((*grouped)[0].month().value(), 6);
    EXPECT_EQ((*grouped)[1].month().value(), 12);
    EXPECT_EQ((*grouped)[2].month().value(), 24);
    EXPECT_EQ((*grouped)[2].amount(), euros(1'250.0));
}

TEST(ExtraPaymentTest, FilterByYearAndTotal) {
    std::vector<ExtraPayment> payments = {
        payment(1, 100.0), payment(12, 200.0), payment(13, 400.0)
    };
    auto first_year = filter_by_year(payments, 1);
    ASSERT_EQ(first_year.size(), 2u);

    auto sum = total(first_year);
    ASSERT_TRUE(sum.has_value());
    EXPECT_EQ(*sum, euros(300.0));

    EXPECT_TRUE(filter_by_year(payments, 3).empty());
}

// ===========================================================================
// ExtraPaymentPlan
// ===========================================================================

TEST(ExtraPaymentPlanTest, NoneIsEmptyAndUnlimited) {
    auto plan = ExtraPaymentPlan::none();
    EXPECT_TRUE(plan.empty());
    EXPECT_TRUE(plan.is_unlimited());
    EXPECT_TRUE(plan.total()->is_zero());
    EXPECT_FALSE(plan.amount_for_month(*PaymentMonth::create(1)).has_value());
}

TEST(ExtraPaymentPlanTest, MergedMonthPastMaximumRejected) {
    std::vector<ExtraPayment> payments = {payment(1, 1'000'000.0), payment(1, 1'000'000.0)};
    auto plan = ExtraPaymentPlan::create(std::nullopt, payments);
    ASSERT_FALSE(plan.has_value());
    EXPECT_EQ(plan.error().code, ValidationErrorCode::InvalidExtraPayment);
}

TEST(ExtraPaymentPlanTest, AmountForMonth) {
    std::vector<ExtraPayment> payments = {payment(24, 5'000.0), payment(12, 5'000.0)};
    auto plan = ExtraPaymentPlan::create(std::nullopt, payments);
    ASSERT_TRUE(plan.has_value());

    auto twelve = plan->amount_for_month(*PaymentMonth::create(12));
    ASSERT_TRUE(twelve.has_value());
    EXPECT_EQ(*twelve, euros(5'000.0));
    EXPECT_FALSE(plan->amount_for_month(*PaymentMonth::create(13)).has_value());
    EXPECT_EQ(*plan->total(), euros(10'000.0));
}

TEST(ExtraPaymentPlanTest, YearlyTotalsAndSummaries) {
    std::vector<ExtraPayment> payments = {
        payment(3, 1'000.0), payment(9, 2'000.0), payment(15, 600.0)
    };
    auto plan = *ExtraPaymentPlan::create(std::nullopt, payments);

    auto totals = plan.yearly_totals();
    ASSERT_TRUE(totals.has_value());
    ASSERT_EQ(totals->size(), 2u);
    EXPECT_EQ(totals->at(1), euros(3'000.0));
    EXPECT_EQ(totals->at(2), euros(600.0));

    auto summaries = plan.yearly_summaries();
    ASSERT_TRUE(summaries.has_value());
    ASSERT_EQ(summaries->size(), 2u);
    EXPECT_EQ((*summaries)[0].year, 1);
    EXPECT_EQ((*summaries)[0].count, 2u);
    EXPECT_EQ((*summaries)[0].average, euros(1'500.0));
    EXPECT_EQ((*summaries)[1].year, 2);
}

TEST(ExtraPaymentPlanTest, RemainingYearlyLimit) {
    std::vector<ExtraPayment> payments = {payment(3, 10'000.0)};
    auto plan = *ExtraPaymentPlan::create(*Percentage::create(5.0), payments);
    auto loan = euros(300'000.0);

    auto remaining = plan.remaining_yearly_limit(loan, 1);
    ASSERT_TRUE(remaining.has_value());
    ASSERT_TRUE(remaining->has_value());
    EXPECT_EQ(**remaining, euros(5'000.0));

    auto untouched = plan.remaining_yearly_limit(loan, 2);
    EXPECT_EQ(**untouched, euros(15'000.0));
}

TEST(ExtraPaymentPlanTest, UnlimitedHasNoRemainingLimit) {
    auto plan = ExtraPaymentPlan::none();
    auto remaining = plan.remaining_yearly_limit(euros(300'000.0), 1);
    ASSERT_TRUE(remaining.has_value());
    EXPECT_FALSE(remaining->has_value());
    EXPECT_TRUE(*plan.can_add_payment(euros(300'000.0), payment(1, 1'000'000.0)));
}

TEST(ExtraPaymentPlanTest, CanAddPaymentIsInformational) {
    std::vector<ExtraPayment> payments = {payment(3, 14'000.0)};
    auto plan = *ExtraPaymentPlan::create(*Percentage::create(5.0), payments);
    auto loan = euros(300'000.0);

    EXPECT_TRUE(*plan.can_add_payment(loan, payment(6, 1'000.0)));
    EXPECT_FALSE(*plan.can_add_payment(loan, payment(6, 1'000.01)));

    // The plan still accepts it; enforcement is up to the caller
    auto extended = plan.with_payment(payment(6, 5'000.0));
    ASSERT_TRUE(extended.has_value());
    EXPECT_EQ(extended->payments().size(), 2u);
}

TEST(ExtraPaymentPlanTest, WithAndWithoutPayment) {
    std::vector<ExtraPayment> payments = {payment(12, 1'000.0)};
    auto plan = *ExtraPaymentPlan::create(std::nullopt, payments);

    auto merged = plan.with_payment(payment(12, 500.0));
    ASSERT_TRUE(merged.has_value());
    ASSERT_EQ(merged->payments().size(), 1u);
    EXPECT_EQ(merged->payments()[0].amount(), euros(1'500.0));

    // The original plan is unchanged
    EXPECT_EQ(plan.payments()[0].amount(), euros(1'000.0));

    auto removed = merged->without_payment(*PaymentMonth::create(12));
    EXPECT_TRUE(removed.empty());
}
