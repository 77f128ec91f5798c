// SPDX-License-Identifier: MIT
#include "tilgung/amortization/amortization_engine.hpp"
#include "tilgung/loan/loan_calculations.hpp"
#include "tilgung/support/tilgung_trace.h"
#include <algorithm>
#include <cmath>
#include <utility>
#include <variant>
#include <vector>

namespace tilgung {

namespace {

std::unexpected<AmortizationError> engine_failure(AmortizationError err) {
    TILGUNG_TRACE_RUNTIME_ERROR(MODULE_AMORTIZATION, static_cast<int>(err.code), err.month);
    return std::unexpected(std::move(err));
}

/// Attach the simulation position to a value-type failure
template <typename T>
std::expected<T, AmortizationError>
in_context(std::expected<T, ValidationError> result, const char* operation,
           size_t month, double balance) {
    return std::move(result).transform_error([&](const ValidationError& err) {
        AmortizationError wrapped = convert_to_amortization_error(err, operation, month, balance);
        TILGUNG_TRACE_RUNTIME_ERROR(MODULE_AMORTIZATION, static_cast<int>(wrapped.code), month);
        return wrapped;
    });
}

/// Keep a converted value in a draft slot, yielding a monostate step
template <typename T>
std::expected<std::monostate, AmortizationError>
store(std::optional<T>& slot, std::expected<T, AmortizationError> value) {
    return std::move(value).transform([&slot](T v) {
        slot = v;
        return std::monostate{};
    });
}

std::expected<Money, AmortizationError>
to_money(double amount, const char* operation, size_t month, double balance) {
    return in_context(Money::from_major(amount), operation, month, balance);
}

std::expected<Money, AmortizationError>
cents_to_money(int64_t cents, const char* operation, size_t month) {
    auto money = Money::from_cents(cents);
    if (!money) {
        return engine_failure(AmortizationError{
            .code = AmortizationErrorCode::ScheduleAnalysis,
            .operation = operation,
            .month = month,
            .balance = 0.0,
            .value = static_cast<double>(cents)
        });
    }
    return *money;
}

/// Everything one simulated month produced, in major units
struct MonthState {
    int64_t month;
    double starting_balance;
    double interest;
    double principal;
    double extra;
    double ending_balance;
    double cumulative_interest;
    double cumulative_principal;
    int64_t remaining_months;
};

/// Entry fields converted so far
struct EntryDraft {
    std::optional<PaymentMonth> month_number;
    std::optional<Money> starting_balance;
    std::optional<Money> interest;
    std::optional<Money> principal;
    std::optional<MonthlyPayment> regular_payment;
    std::optional<Money> extra_payment;
    std::optional<Money> total_payment_amount;
    std::optional<Money> ending_balance;
    std::optional<Money> cumulative_interest;
    std::optional<Money> cumulative_principal;
    std::optional<Percentage> principal_percentage;
    std::optional<MonthCount> remaining_months;
};

std::expected<AmortizationEntry, AmortizationError> build_entry(const MonthState& s) {
    using Step = std::expected<std::monostate, AmortizationError>;

    const size_t month = static_cast<size_t>(s.month);
    const double balance = s.ending_balance;
    auto money = [month, balance](double amount, const char* operation) {
        return to_money(amount, operation, month, balance);
    };

    // Extra payments are recorded only when at least one cent was applied
    auto apply_extra = [&](EntryDraft& d) -> Step {
        d.total_payment_amount = d.regular_payment->total();
        if (s.extra <= 0.0) {
            return std::monostate{};
        }
        return money(s.extra, "create_extra_payment").and_then([&](Money extra) -> Step {
            if (extra.is_zero()) {
                return std::monostate{};
            }
            d.extra_payment = extra;
            return store(d.total_payment_amount,
                         in_context(d.total_payment_amount->add(extra), "create_total_payment",
                                    month, balance));
        });
    };

    const double cash = s.principal + s.interest + s.extra;
    const double share = cash > 0.0 ? (s.principal + s.extra) / cash * 100.0 : 0.0;

    EntryDraft d;
    return store(d.month_number, in_context(PaymentMonth::create(s.month),
                                            "create_payment_month", month, balance))
        .and_then([&](auto) { return store(d.interest, money(s.interest, "create_interest")); })
        .and_then([&](auto) { return store(d.principal, money(s.principal, "create_principal")); })
        .and_then([&](auto) {
            return store(d.regular_payment,
                         in_context(MonthlyPayment::from_split(*d.principal, *d.interest),
                                    "create_regular_payment", month, balance));
        })
        .and_then([&](auto) { return apply_extra(d); })
        .and_then([&](auto) {
            return store(d.starting_balance, money(s.starting_balance, "create_starting_balance"));
        })
        .and_then([&](auto) {
            return store(d.ending_balance, money(s.ending_balance, "create_ending_balance"));
        })
        .and_then([&](auto) {
            return store(d.cumulative_interest,
                         money(s.cumulative_interest, "create_cumulative_interest"));
        })
        .and_then([&](auto) {
            return store(d.cumulative_principal,
                         money(s.cumulative_principal, "create_cumulative_principal"));
        })
        .and_then([&](auto) {
            return store(d.principal_percentage,
                         in_context(Percentage::create(std::clamp(share, 0.0, 100.0)),
                                    "calculate_principal_percentage", month, balance));
        })
        .and_then([&](auto) {
            return store(d.remaining_months,
                         in_context(MonthCount::create(s.remaining_months),
                                    "calculate_remaining_months", month, balance));
        })
        .transform([&](auto) {
            return AmortizationEntry{
                .month_number = *d.month_number,
                .starting_balance = *d.starting_balance,
                .regular_payment = *d.regular_payment,
                .extra_payment = d.extra_payment,
                .total_payment_amount = *d.total_payment_amount,
                .ending_balance = *d.ending_balance,
                .cumulative_interest = *d.cumulative_interest,
                .cumulative_principal = *d.cumulative_principal,
                .principal_percentage = *d.principal_percentage,
                .remaining_months = *d.remaining_months
            };
        });
}

}  // namespace

std::expected<AmortizationSchedule, AmortizationError>
generate_schedule(const LoanConfiguration& config,
                  const std::optional<ExtraPaymentPlan>& plan,
                  const ScheduleConfig& schedule_config) {
    const double loan = config.amount().to_major();
    const double c = config.annual_rate().monthly_rate();
    const int64_t term = config.term().value();
    const int64_t max_months = term * schedule_config.safety_term_multiplier;
    const double epsilon = schedule_config.precision.balance_epsilon;

    // The contractual instalment, fixed for the whole simulation
    auto payment = annuity_payment(config);
    if (!payment) {
        return engine_failure(convert_to_amortization_error(payment.error(), "annuity_payment"));
    }
    const double regular_payment = *payment;

    TILGUNG_TRACE_SCHEDULE_START(term, loan, plan ? plan->payments().size() : 0);

    std::vector<AmortizationEntry> entries;
    entries.reserve(static_cast<size_t>(term));

    double balance = loan;
    double cumulative_interest = 0.0;

    for (int64_t month = 1; balance > epsilon; ++month) {
        if (month > max_months) {
            return engine_failure(AmortizationError{
                .code = AmortizationErrorCode::SafetyLimitExceeded,
                .operation = "generate_schedule",
                .month = static_cast<size_t>(month - 1),
                .balance = balance,
                .value = static_cast<double>(max_months)
            });
        }

        MonthState state{};
        state.month = month;
        state.starting_balance = balance;
        state.interest = balance * c;
        state.principal = std::min(regular_payment - state.interest, balance);
        state.extra = 0.0;

        if (plan) {
            auto payment_month = PaymentMonth::create(month);
            if (!payment_month) {
                return engine_failure(convert_to_amortization_error(
                    payment_month.error(), "lookup_extra_payment",
                    static_cast<size_t>(month), balance));
            }
            if (auto planned = plan->amount_for_month(*payment_month)) {
                double requested = planned->to_major();
                state.extra = std::max(0.0, std::min(requested, balance - state.principal));
                TILGUNG_TRACE_EXTRA_PAYMENT_APPLIED(month, requested, state.extra);
            }
        }

        balance -= state.principal + state.extra;

        // Sub-cent residue is settled with this month's principal
        if (balance <= epsilon) {
            state.principal += balance;
            balance = 0.0;
        }

        cumulative_interest += state.interest;
        state.ending_balance = balance;
        state.cumulative_interest = cumulative_interest;
        state.cumulative_principal = loan - balance;
        state.remaining_months = std::max<int64_t>(1, term - month + 1);

        auto entry = build_entry(state);
        if (!entry) {
            return std::unexpected(entry.error());
        }
        entries.push_back(*entry);

        TILGUNG_TRACE_SCHEDULE_MONTH(month, balance, state.interest);
        if (month % 12 == 0) {
            TILGUNG_TRACE_ALGO_PROGRESS(MODULE_AMORTIZATION, month, term, balance);
        }
    }

    auto metrics = calculate_metrics(config, entries);
    if (!metrics) {
        return std::unexpected(metrics.error());
    }

    TILGUNG_TRACE_SCHEDULE_COMPLETE(entries.size(), metrics->total_interest.to_major());
    return AmortizationSchedule(config, plan, std::move(entries), *metrics);
}

std::expected<ScheduleMetrics, AmortizationError>
calculate_metrics(const LoanConfiguration& config, std::span<const AmortizationEntry> entries) {
    if (entries.empty()) {
        return engine_failure(AmortizationError{
            .code = AmortizationErrorCode::ScheduleAnalysis,
            .operation = "calculate_metrics",
            .month = 0,
            .balance = config.amount().to_major(),
            .value = std::nullopt
        });
    }

    const AmortizationEntry& last = entries.back();
    const size_t months = entries.size();

    int64_t extra_cents = 0;
    int64_t payment_cents = 0;
    int64_t largest_cents = entries.front().total_payment_amount.cents();
    int64_t smallest_cents = largest_cents;
    for (const auto& entry : entries) {
        if (entry.extra_payment) {
            extra_cents += entry.extra_payment->cents();
        }
        int64_t paid = entry.total_payment_amount.cents();
        payment_cents += paid;
        largest_cents = std::max(largest_cents, paid);
        smallest_cents = std::min(smallest_cents, paid);
    }

    // Running totals carried by the last entry are rounded once, not per month
    const int64_t interest_cents = last.cumulative_interest.cents();
    const int64_t principal_cents = last.cumulative_principal.cents() - extra_cents;
    const int64_t total_cents = interest_cents + last.cumulative_principal.cents();

    auto original_interest = baseline_interest(config);
    if (!original_interest) {
        return engine_failure(convert_to_amortization_error(original_interest.error(),
                                                            "calculate_original_interest"));
    }
    const int64_t saved_cents = std::max<int64_t>(0, original_interest->cents() - interest_cents);
    const int64_t average_cents =
        std::llround(static_cast<double>(payment_cents) / static_cast<double>(months));

    const double effective_rate = extra_cents > 0
        ? static_cast<double>(saved_cents) / static_cast<double>(extra_cents) * 100.0
        : config.annual_rate().percent();

    const int64_t last_month = last.month_number.value();

    std::optional<Money> interest_total, total_principal, total_extra, total_payments;
    std::optional<Money> interest_saved, average, largest, smallest;
    std::optional<MonthCount> actual_term;

    return store(interest_total, cents_to_money(interest_cents, "calculate_total_interest", months))
        .and_then([&](auto) {
            return store(total_principal,
                         cents_to_money(principal_cents, "calculate_total_principal", months));
        })
        .and_then([&](auto) {
            return store(total_extra, cents_to_money(extra_cents, "calculate_total_extra", months));
        })
        .and_then([&](auto) {
            return store(total_payments,
                         cents_to_money(total_cents, "calculate_total_payments", months));
        })
        .and_then([&](auto) {
            return store(interest_saved,
                         cents_to_money(saved_cents, "calculate_interest_saved", months));
        })
        .and_then([&](auto) {
            return store(average, cents_to_money(average_cents, "calculate_average_payment", months));
        })
        .and_then([&](auto) {
            return store(largest, cents_to_money(largest_cents, "calculate_largest_payment", months));
        })
        .and_then([&](auto) {
            return store(smallest,
                         cents_to_money(smallest_cents, "calculate_smallest_payment", months));
        })
        .and_then([&](auto) {
            return store(actual_term, in_context(MonthCount::create(static_cast<int64_t>(months)),
                                                 "calculate_actual_term", months, 0.0));
        })
        .transform([&](auto) {
            return ScheduleMetrics{
                .total_interest = *interest_total,
                .total_principal = *total_principal,
                .total_extra_payments = *total_extra,
                .total_payments = *total_payments,
                .actual_term = *actual_term,
                .interest_saved = *interest_saved,
                .term_reduction_months =
                    std::max<int64_t>(0, config.term().value() - actual_term->value()),
                .effective_interest_rate = effective_rate,
                .average_payment = *average,
                .largest_payment = *largest,
                .smallest_payment = *smallest,
                .payoff_date = PayoffDate{
                    .year = (last_month - 1) / 12 + 1,
                    .month = (last_month - 1) % 12 + 1
                }
            };
        });
}

std::expected<AmortizationSchedule, AmortizationError>
apply_extra_payments(const AmortizationSchedule& schedule, const ExtraPaymentPlan& plan,
                     const ScheduleConfig& schedule_config) {
    return generate_schedule(schedule.loan_configuration(), plan, schedule_config);
}

std::expected<ScheduleComparison, AmortizationError>
compare_schedules(const AmortizationSchedule& base, const AmortizationSchedule& comparison) {
    const ScheduleMetrics& a = base.metrics();
    const ScheduleMetrics& b = comparison.metrics();

    const int64_t savings_cents = a.total_interest.cents() - b.total_interest.cents();
    const int64_t extra_cents = b.total_extra_payments.cents();
    const double roi = extra_cents > 0
        ? static_cast<double>(savings_cents) / static_cast<double>(extra_cents) * 100.0
        : 0.0;

    return cents_to_money(std::max<int64_t>(0, savings_cents), "compare_schedules", base.size())
        .transform([&](Money savings) {
            return ScheduleComparison{
                .interest_savings = savings,
                .term_reduction_months =
                    std::max<int64_t>(0, a.actual_term.value() - b.actual_term.value()),
                .total_extra_payments = b.total_extra_payments,
                .return_on_investment = roi,
                .is_worthwhile = savings_cents > 0 && roi > 2.0
            };
        });
}

std::expected<AmortizationEntry, AmortizationError>
schedule_entry(const AmortizationSchedule& schedule, PaymentMonth month) {
    // Entries are consecutive from month 1
    const auto index = static_cast<size_t>(month.value() - 1);
    if (index >= schedule.size()) {
        return std::unexpected(AmortizationError{
            .code = AmortizationErrorCode::EntryNotFound,
            .operation = "schedule_entry",
            .month = static_cast<size_t>(month.value()),
            .balance = 0.0,
            .value = static_cast<double>(schedule.size())
        });
    }
    return schedule.entries()[index];
}

Money remaining_balance_at(const AmortizationSchedule& schedule, PaymentMonth month) {
    auto entry = schedule_entry(schedule, month);
    return entry ? entry->ending_balance : Money::zero();
}

std::expected<FirstYearSummary, AmortizationError>
first_year_summary(const AmortizationSchedule& schedule) {
    if (schedule.size() == 0) {
        return engine_failure(AmortizationError{
            .code = AmortizationErrorCode::ScheduleAnalysis,
            .operation = "first_year_summary",
            .month = 0,
            .balance = 0.0,
            .value = std::nullopt
        });
    }

    const auto first_year = schedule.entries().first(std::min<size_t>(12, schedule.size()));

    int64_t paid = 0;
    int64_t interest = 0;
    int64_t principal = 0;
    int64_t extra = 0;
    for (const auto& entry : first_year) {
        paid += entry.total_payment_amount.cents();
        interest += entry.regular_payment.interest().cents();
        principal += entry.regular_payment.principal().cents();
        if (entry.extra_payment) {
            extra += entry.extra_payment->cents();
        }
    }

    const size_t n = first_year.size();
    std::optional<Money> total_paid, interest_paid, principal_paid, extra_paid;

    return store(total_paid, cents_to_money(paid, "first_year_summary", n))
        .and_then([&](auto) {
            return store(interest_paid, cents_to_money(interest, "first_year_summary", n));
        })
        .and_then([&](auto) {
            return store(principal_paid, cents_to_money(principal, "first_year_summary", n));
        })
        .and_then([&](auto) {
            return store(extra_paid, cents_to_money(extra, "first_year_summary", n));
        })
        .transform([&](auto) {
            return FirstYearSummary{
                .months = n,
                .total_paid = *total_paid,
                .interest_paid = *interest_paid,
                .principal_paid = *principal_paid,
                .extra_paid = *extra_paid,
                .ending_balance = first_year.back().ending_balance
            };
        });
}

}  // namespace tilgung
