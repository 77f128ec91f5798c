// SPDX-License-Identifier: MIT
#include "tilgung/analytics/sondertilgung_analytics.hpp"
#include "tilgung/amortization/amortization_engine.hpp"
#include "tilgung/loan/loan_calculations.hpp"
#include "tilgung/support/parallel.hpp"
#include "tilgung/support/tilgung_trace.h"
#include <algorithm>
#include <array>
#include <optional>
#include <utility>

namespace tilgung {

namespace {

template <typename Cause>
std::unexpected<AnalyticsError> analytics_failure(AnalyticsErrorCode code, Cause cause,
                                                  size_t index = 0) {
    TILGUNG_TRACE_RUNTIME_ERROR(MODULE_ANALYTICS, static_cast<int>(code), index);
    return std::unexpected(AnalyticsError{.code = code, .index = index, .cause = std::move(cause)});
}

/// Interest saved by a single payment on a loan
std::expected<Money, AnalyticsError>
single_payment_savings(const LoanConfiguration& config, const ExtraPaymentPlan& plan) {
    auto schedule = generate_schedule(config, plan);
    if (!schedule) {
        return analytics_failure(AnalyticsErrorCode::ScheduleFailed, schedule.error());
    }
    return schedule->metrics().interest_saved;
}

}  // namespace

std::expected<SondertilgungImpact, AnalyticsError>
sondertilgung_impact(const LoanConfiguration& config, const ExtraPaymentPlan& plan) {
    TILGUNG_TRACE_ALGO_START(MODULE_ANALYTICS, plan.payments().size(),
                             config.amount().to_major(), config.annual_rate().percent());

    auto original_interest = baseline_interest(config);
    if (!original_interest) {
        return analytics_failure(AnalyticsErrorCode::LoanCalculationFailed,
                                 original_interest.error());
    }

    auto schedule = generate_schedule(config, plan);
    if (!schedule) {
        return analytics_failure(AnalyticsErrorCode::ScheduleFailed, schedule.error());
    }

    const ScheduleMetrics& metrics = schedule->metrics();
    const int64_t saved_cents =
        std::max<int64_t>(0, original_interest->cents() - metrics.total_interest.cents());
    auto saved = Money::from_cents(saved_cents);
    if (!saved) {
        return analytics_failure(AnalyticsErrorCode::ScheduleFailed, saved.error());
    }

    const int64_t extra_cents = metrics.total_extra_payments.cents();
    const double effective_rate = extra_cents > 0
        ? static_cast<double>(saved_cents) / static_cast<double>(extra_cents) * 100.0
        : 0.0;

    TILGUNG_TRACE_ALGO_COMPLETE(MODULE_ANALYTICS, schedule->size(), saved->to_major());

    return SondertilgungImpact{
        .interest_saved = *saved,
        .original_total_interest = *original_interest,
        .new_total_interest = metrics.total_interest,
        .original_term = config.term(),
        .new_term = metrics.actual_term,
        .term_reduction_months =
            std::max<int64_t>(0, config.term().value() - metrics.actual_term.value()),
        .total_extra_payments = metrics.total_extra_payments,
        .effective_interest_rate = effective_rate
    };
}

std::expected<Money, AnalyticsError>
optimal_extra_payment(const LoanConfiguration& config, PaymentMonth month, Money max_amount) {
    // Balance outstanding when the extra payment month starts
    auto balance = remaining_balance(config, month.value() - 1);
    if (!balance) {
        return analytics_failure(AnalyticsErrorCode::LoanCalculationFailed, balance.error());
    }
    return std::min(max_amount, *balance);
}

std::expected<std::vector<StrategyResult>, AnalyticsError>
compare_strategies(const LoanConfiguration& config, std::span<const ExtraPaymentPlan> plans) {
    const size_t n = plans.size();
    TILGUNG_TRACE_ALGO_START(MODULE_BATCH, n, config.amount().to_major(),
                             config.annual_rate().percent());

    std::vector<std::expected<SondertilgungImpact, AnalyticsError>> slots(
        n, std::unexpected(AnalyticsError{.code = AnalyticsErrorCode::ScheduleFailed}));

    // Schedules differ in length with the plan
    TILGUNG_PRAGMA_PARALLEL_FOR_DYNAMIC
    for (size_t i = 0; i < n; ++i) {
        slots[i] = sondertilgung_impact(config, plans[i]);
    }

    std::vector<StrategyResult> results;
    results.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        if (!slots[i]) {
            AnalyticsError err = slots[i].error();
            err.index = i;
            TILGUNG_TRACE_RUNTIME_ERROR(MODULE_BATCH, static_cast<int>(err.code), i);
            return std::unexpected(std::move(err));
        }
        results.push_back(StrategyResult{.plan_index = i, .impact = *slots[i]});
    }

    std::stable_sort(results.begin(), results.end(),
                     [](const StrategyResult& a, const StrategyResult& b) {
                         return a.impact.interest_saved > b.impact.interest_saved;
                     });

    TILGUNG_TRACE_ALGO_COMPLETE(MODULE_BATCH, n, 0.0);
    return results;
}

std::expected<InterestSensitivity, AnalyticsError>
interest_sensitivity(const LoanConfiguration& config, Money amount, PaymentMonth month) {
    auto payment = ExtraPayment::create(month, amount);
    if (!payment) {
        return analytics_failure(AnalyticsErrorCode::InvalidAdjustment, payment.error());
    }
    const std::array<ExtraPayment, 1> payments{*payment};
    auto plan = ExtraPaymentPlan::create(std::nullopt, payments);
    if (!plan) {
        return analytics_failure(AnalyticsErrorCode::InvalidAdjustment, plan.error());
    }

    const double base_percent = config.annual_rate().percent();
    const std::array<double, 2> shifted_percent{
        std::max(0.1, base_percent - 1.0),
        std::min(25.0, base_percent + 1.0)
    };

    // Slot 0 low, 1 base, 2 high. Shifted loans keep amount and term.
    std::array<std::optional<LoanConfiguration>, 3> configs{};
    configs[1] = config;
    for (size_t i = 0; i < shifted_percent.size(); ++i) {
        auto rate = InterestRate::create(shifted_percent[i]);
        if (!rate) {
            return analytics_failure(AnalyticsErrorCode::InvalidAdjustment, rate.error(), i);
        }
        auto shifted = LoanConfiguration::with_computed_payment(config.amount(), *rate,
                                                                config.term());
        if (!shifted) {
            return analytics_failure(AnalyticsErrorCode::InvalidAdjustment, shifted.error(), i);
        }
        configs[i == 0 ? 0 : 2] = *shifted;
    }

    std::array<std::expected<Money, AnalyticsError>, 3> savings{
        Money::zero(), Money::zero(), Money::zero()
    };

    TILGUNG_PRAGMA_PARALLEL_FOR
    for (size_t i = 0; i < configs.size(); ++i) {
        savings[i] = single_payment_savings(*configs[i], *plan);
    }

    for (size_t i = 0; i < savings.size(); ++i) {
        if (!savings[i]) {
            AnalyticsError err = savings[i].error();
            err.index = i;
            return std::unexpected(std::move(err));
        }
    }

    const int64_t low = savings[0]->cents();
    const int64_t base = savings[1]->cents();
    const int64_t high = savings[2]->cents();
    const double sensitivity = base > 0
        ? static_cast<double>(high - low) / (2.0 * static_cast<double>(base)) * 100.0
        : 0.0;

    return InterestSensitivity{
        .low_rate_savings = *savings[0],
        .base_savings = *savings[1],
        .high_rate_savings = *savings[2],
        .sensitivity = sensitivity
    };
}

std::expected<PaymentMonth, AnalyticsError>
payoff_month(const LoanConfiguration& config, const ExtraPaymentPlan& plan) {
    auto schedule = generate_schedule(config, plan);
    if (!schedule) {
        return analytics_failure(AnalyticsErrorCode::ScheduleFailed, schedule.error());
    }
    return schedule->back().month_number;
}

}  // namespace tilgung
