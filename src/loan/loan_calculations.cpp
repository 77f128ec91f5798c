// SPDX-License-Identifier: MIT
#include "tilgung/loan/loan_calculations.hpp"
#include "tilgung/loan/annuity.hpp"
#include "tilgung/math/safe_math.hpp"
#include "tilgung/support/parallel.hpp"
#include "tilgung/support/tilgung_trace.h"
#include <algorithm>
#include <cmath>
#include <limits>

namespace tilgung {

namespace {

std::unexpected<LoanError> loan_failure(LoanErrorCode code, double value = 0.0,
                                        size_t iterations = 0) {
    TILGUNG_TRACE_RUNTIME_ERROR(MODULE_LOAN_ALGEBRA, static_cast<int>(code), value);
    return std::unexpected(LoanError{.code = code, .value = value, .iterations = iterations});
}

std::expected<MonthCount, LoanError> months_from_count(double months) {
    if (!std::isfinite(months) || months > static_cast<double>(kMaxLoanMonths)) {
        return loan_failure(LoanErrorCode::InvalidParameters, months);
    }
    auto count = MonthCount::create(static_cast<int64_t>(months));
    if (!count) {
        return loan_failure(LoanErrorCode::InvalidParameters, months);
    }
    return *count;
}

}  // namespace

std::expected<double, LoanError> annuity_payment(const LoanConfiguration& config) {
    return annuity_payment(config.amount().to_major(), config.annual_rate().monthly_rate(),
                           config.term().value());
}

std::expected<MonthlyPayment, LoanError> monthly_payment(const LoanConfiguration& config) {
    return monthly_payment(config.amount(), config.annual_rate(), config.term());
}

std::expected<MonthlyPayment, LoanError>
monthly_payment(Money amount, InterestRate annual_rate, MonthCount term) {
    double loan = amount.to_major();
    double c = annual_rate.monthly_rate();

    TILGUNG_TRACE_ALGO_START(MODULE_LOAN_ALGEBRA, term.value(), loan, c);

    auto payment = annuity_payment(loan, c, term.value());
    if (!payment) {
        return loan_failure(payment.error().code, payment.error().value);
    }

    auto total = Money::from_major(*payment);
    if (!total) {
        return loan_failure(LoanErrorCode::MathematicalError, *payment);
    }

    if (annual_rate.is_zero()) {
        auto all_principal = MonthlyPayment::from_split(*total, Money::zero());
        if (!all_principal) {
            return loan_failure(LoanErrorCode::MathematicalError, *payment);
        }
        return *all_principal;
    }

    double first_interest = loan * c;
    double first_principal = *payment - first_interest;
    auto interest = Money::from_major(first_interest);
    auto principal = Money::from_major(first_principal);
    if (!interest || !principal) {
        return loan_failure(LoanErrorCode::MathematicalError, first_principal);
    }

    auto result = MonthlyPayment::create(*principal, *interest, *total);
    if (!result) {
        return loan_failure(LoanErrorCode::MathematicalError, result.error().value);
    }

    TILGUNG_TRACE_ALGO_COMPLETE(MODULE_LOAN_ALGEBRA, 1, *payment);
    return *result;
}

std::expected<MonthCount, LoanError>
loan_term(Money amount, InterestRate annual_rate, Money payment) {
    if (payment.is_zero()) {
        return loan_failure(LoanErrorCode::InsufficientPayment, 0.0);
    }

    double loan = amount.to_major();
    double pay = payment.to_major();

    const double half_cent = 0.5 / static_cast<double>(kMinorUnitsPerMajor);
    const double c = annual_rate.monthly_rate();
    const double first_interest = loan * c;

    if (!annual_rate.is_zero() && pay <= first_interest) {
        return loan_failure(LoanErrorCode::InsufficientPayment, pay);
    }
    // More than the whole debt after one month
    if (pay > loan + first_interest + half_cent) {
        return loan_failure(LoanErrorCode::PaymentTooHigh, pay);
    }

    // n = -ln(1 - L*c/P) / ln(1 + c), unbounded once P no longer covers interest
    auto months_for = [loan, c, first_interest](double p) {
        if (c == 0.0) {
            return loan / p;
        }
        if (p <= first_interest) {
            return std::numeric_limits<double>::infinity();
        }
        return -std::log1p(-first_interest / p) / std::log1p(c);
    };

    double exact = months_for(pay);
    if (!std::isfinite(exact) || exact <= 0.0) {
        return loan_failure(LoanErrorCode::MathematicalError, exact);
    }

    // The payment is rounded to cents. Whole terms whose exact annuity rounds
    // to it lie in [lower, upper]; the one nearest the exact solution wins.
    // Otherwise the last month is a partial one.
    double lower = std::ceil(months_for(pay + half_cent) - 1e-9);
    double upper = std::min(std::floor(months_for(pay - half_cent) + 1e-9),
                            static_cast<double>(kMaxLoanMonths));
    double months = lower <= upper ? std::clamp(std::round(exact), lower, upper)
                                   : std::ceil(exact - 1e-9);
    return months_from_count(months);
}

std::expected<InterestRate, LoanError>
interest_rate(Money amount, Money payment, MonthCount term, const RootFindingConfig& config) {
    if (amount.is_zero() || payment.is_zero()) {
        return loan_failure(LoanErrorCode::InvalidParameters, payment.to_major());
    }

    double loan = amount.to_major();
    double pay = payment.to_major();
    int64_t n = term.value();

    double zero_rate_payment = loan / static_cast<double>(n);
    if (std::abs(pay - zero_rate_payment) < config.tolerance) {
        auto zero = InterestRate::create(0.0);
        if (!zero) {
            return loan_failure(LoanErrorCode::InvalidParameters, 0.0);
        }
        return *zero;
    }
    if (pay < zero_rate_payment) {
        return loan_failure(LoanErrorCode::InsufficientPayment, pay);
    }

    auto residual = [loan, pay, n](double annual) {
        auto p = annuity_payment(loan, annual / 12.0, n);
        return p ? *p - pay : std::numeric_limits<double>::quiet_NaN();
    };

    auto result = bisection_find_root(residual, config.lower_bound, config.upper_bound, config);
    if (!result.converged || !result.root) {
        return loan_failure(LoanErrorCode::MathematicalError, result.final_error,
                            result.iterations);
    }

    // The bracket reaches past the rate domain. A root within tolerance of
    // the domain edge belongs to it.
    double root = *result.root;
    const double max_rate = InterestRate::kMaxPercent / 100.0;
    if (root > max_rate) {
        double at_max = residual(max_rate);
        if (!std::isfinite(at_max) || std::abs(at_max) > config.tolerance) {
            return loan_failure(LoanErrorCode::MathematicalError, root * 100.0,
                                result.iterations);
        }
        root = max_rate;
    }

    auto rate = InterestRate::from_decimal(root);
    if (!rate) {
        return loan_failure(LoanErrorCode::MathematicalError, root * 100.0, result.iterations);
    }
    return *rate;
}

std::expected<Money, LoanError> total_interest(const LoanConfiguration& config) {
    auto payment = monthly_payment(config);
    if (!payment) {
        return std::unexpected(payment.error());
    }

    int64_t n = config.term().value();
    auto paid_cents = safe_multiply(payment->total().cents(), n);
    if (!paid_cents) {
        return loan_failure(LoanErrorCode::MathematicalError, payment->total().to_major());
    }
    int64_t interest_cents = *paid_cents - config.amount().cents();

    // A payment rounded down loses under one cent per month at a zero rate
    if (interest_cents < 0 && -interest_cents <= n) {
        interest_cents = 0;
    }

    auto interest = Money::from_cents(interest_cents);
    if (!interest) {
        return loan_failure(LoanErrorCode::MathematicalError,
                            static_cast<double>(interest_cents));
    }
    return *interest;
}

std::expected<Money, LoanError> baseline_interest(const LoanConfiguration& config) {
    auto payment = annuity_payment(config);
    if (!payment) {
        return std::unexpected(payment.error());
    }

    double interest = *payment * static_cast<double>(config.term().value()) -
                      config.amount().to_major();
    auto money = Money::from_major(std::max(0.0, interest));
    if (!money) {
        return loan_failure(LoanErrorCode::MathematicalError, interest);
    }
    return *money;
}

std::expected<Money, LoanError>
remaining_balance(const LoanConfiguration& config, int64_t payments_made) {
    if (payments_made < 0) {
        return loan_failure(LoanErrorCode::InvalidParameters,
                            static_cast<double>(payments_made));
    }

    double balance = annuity_balance(config.amount().to_major(),
                                     config.annual_rate().monthly_rate(),
                                     config.term().value(), payments_made);

    auto money = Money::from_major(balance);
    if (!money) {
        return loan_failure(LoanErrorCode::MathematicalError, balance);
    }
    return *money;
}

std::expected<MonthCount, LoanError>
break_even_point(const LoanConfiguration& current, const LoanConfiguration& refinanced,
                 Money refinancing_costs) {
    auto current_payment = monthly_payment(current);
    if (!current_payment) {
        return std::unexpected(current_payment.error());
    }
    auto new_payment = monthly_payment(refinanced);
    if (!new_payment) {
        return std::unexpected(new_payment.error());
    }

    int64_t savings = current_payment->total().cents() - new_payment->total().cents();
    if (savings <= 0) {
        return loan_failure(LoanErrorCode::InsufficientPayment,
                            new_payment->total().to_major());
    }

    int64_t costs = refinancing_costs.cents();
    int64_t months = (costs + savings - 1) / savings;
    return months_from_count(static_cast<double>(months));
}

std::expected<std::vector<MonthlyPayment>, LoanError>
payment_scenarios(const LoanConfiguration& base, std::span<const PaymentAdjustment> adjustments) {
    const size_t n = adjustments.size();
    TILGUNG_TRACE_ALGO_START(MODULE_BATCH, n, base.amount().to_major(),
                             base.annual_rate().percent());

    std::vector<std::expected<MonthlyPayment, LoanError>> slots(
        n, std::unexpected(LoanError{.code = LoanErrorCode::InvalidParameters}));

    TILGUNG_PRAGMA_PARALLEL_FOR
    for (size_t i = 0; i < n; ++i) {
        const PaymentAdjustment& adj = adjustments[i];

        double multiplier = adj.amount_multiplier.value_or(1.0);
        if (!std::isfinite(multiplier) || multiplier <= 0.0) {
            slots[i] = std::unexpected(LoanError{.code = LoanErrorCode::InvalidParameters,
                                                 .value = multiplier});
            continue;
        }
        auto amount = base.amount().multiply(multiplier);
        auto rate = InterestRate::create(base.annual_rate().percent() +
                                         adj.rate_adjustment.value_or(0.0));
        auto term = MonthCount::create(base.term().value() + adj.term_adjustment.value_or(0));
        if (!amount || !rate || !term) {
            slots[i] = std::unexpected(LoanError{.code = LoanErrorCode::InvalidLoanConfiguration});
            continue;
        }

        slots[i] = monthly_payment(*amount, *rate, *term);
    }

    std::vector<MonthlyPayment> results;
    results.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        if (!slots[i]) {
            LoanError err = slots[i].error();
            err.index = i;
            TILGUNG_TRACE_RUNTIME_ERROR(MODULE_BATCH, static_cast<int>(err.code), i);
            return std::unexpected(err);
        }
        results.push_back(*slots[i]);
    }

    TILGUNG_TRACE_ALGO_COMPLETE(MODULE_BATCH, n, 0.0);
    return results;
}

double initial_repayment_rate(const LoanConfiguration& config) {
    double loan = config.amount().to_major();
    double yearly_payment = 12.0 * config.monthly_payment().to_major();
    double yearly_interest = loan * config.annual_rate().to_decimal();
    return (yearly_payment - yearly_interest) / loan * 100.0;
}

}  // namespace tilgung
