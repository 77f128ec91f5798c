// SPDX-License-Identifier: MIT
#include "tilgung/loan/loan_configuration.hpp"
#include "tilgung/loan/annuity.hpp"
#include "tilgung/support/tilgung_trace.h"
#include <cmath>
#include <variant>

namespace tilgung {

namespace {

std::expected<std::monostate, ValidationError>
validate_amount_positive(Money amount) {
    if (amount.is_zero()) {
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidLoanAmount, 0.0));
    }
    return std::monostate{};
}

std::expected<std::monostate, ValidationError>
validate_payment_positive(Money payment) {
    if (payment.is_zero()) {
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidMonthlyPayment, 0.0));
    }
    return std::monostate{};
}

/// Payment must match the annuity formula within tolerance
std::expected<std::monostate, ValidationError>
validate_parameter_consistency(Money amount, InterestRate rate, MonthCount term,
                               Money payment, const PrecisionConfig& precision) {
    auto expected_payment = annuity_payment(amount.to_major(), rate.monthly_rate(), term.value());
    if (!expected_payment) {
        return std::unexpected(ValidationError(ValidationErrorCode::InconsistentParameters,
                                               payment.to_major()));
    }

    double tolerance = rate.is_zero() ? precision.zero_rate_payment_tolerance
                                      : precision.payment_tolerance;
    double deviation = std::abs(payment.to_major() - *expected_payment);
    // Compare in whole cents
    if (std::llround(deviation * kMinorUnitsPerMajor) >
        std::llround(tolerance * kMinorUnitsPerMajor)) {
        TILGUNG_TRACE_VALIDATION_ERROR(MODULE_LOAN_ALGEBRA,
            static_cast<int>(ValidationErrorCode::InconsistentParameters),
            payment.to_major(), *expected_payment);
        return std::unexpected(ValidationError(ValidationErrorCode::InconsistentParameters,
                                               payment.to_major()));
    }
    return std::monostate{};
}

}  // namespace

std::expected<LoanConfiguration, ValidationError>
LoanConfiguration::create(Money amount, InterestRate annual_rate, MonthCount term,
                          Money monthly_payment, const PrecisionConfig& precision) noexcept {
    return validate_amount_positive(amount)
        .and_then([&](auto) { return validate_payment_positive(monthly_payment); })
        .and_then([&](auto) {
            return validate_parameter_consistency(amount, annual_rate, term, monthly_payment,
                                                  precision);
        })
        .transform([&](auto) {
            return LoanConfiguration(amount, annual_rate, term, monthly_payment);
        });
}

std::expected<LoanConfiguration, ValidationError>
LoanConfiguration::from_input(const LoanConfigurationInput& input,
                              const PrecisionConfig& precision) noexcept {
    bool term_provided = input.term_in_months.has_value() || input.term_in_years.has_value();
    if (!input.amount || !input.annual_rate || !input.monthly_payment || !term_provided) {
        return std::unexpected(ValidationError(ValidationErrorCode::InconsistentParameters));
    }

    const double raw_amount = *input.amount;
    if (!std::isfinite(raw_amount) || raw_amount < kMinLoanAmount || raw_amount > kMaxLoanAmount) {
        return std::unexpected(ValidationError(ValidationErrorCode::InvalidLoanAmount, raw_amount));
    }
    const double raw_payment = *input.monthly_payment;

    auto term = input.term_in_months ? MonthCount::create(*input.term_in_months)
                                     : MonthCount::from_years(*input.term_in_years);

    return Money::from_major(raw_amount)
        .transform_error([raw_amount](const ValidationError&) {
            return ValidationError(ValidationErrorCode::InvalidLoanAmount, raw_amount);
        })
        .and_then([&](Money amount) {
            return InterestRate::create(*input.annual_rate).and_then([&](InterestRate rate) {
                return term
                    .transform_error([](const ValidationError& err) {
                        return ValidationError(ValidationErrorCode::InvalidTerm, err.value);
                    })
                    .and_then([&](MonthCount months) {
                        return Money::from_major(raw_payment)
                            .transform_error([raw_payment](const ValidationError&) {
                                return ValidationError(ValidationErrorCode::InvalidMonthlyPayment,
                                                       raw_payment);
                            })
                            .and_then([&](Money payment) {
                                return create(amount, rate, months, payment, precision);
                            });
                    });
            });
        });
}

std::expected<LoanConfiguration, ValidationError>
LoanConfiguration::with_computed_payment(Money amount, InterestRate annual_rate,
                                         MonthCount term) noexcept {
    auto payment = annuity_payment(amount.to_major(), annual_rate.monthly_rate(), term.value());
    if (!payment) {
        return std::unexpected(ValidationError(ValidationErrorCode::InconsistentParameters,
                                               payment.error().value));
    }
    return Money::from_major(*payment).and_then([&](Money payment_money) {
        return create(amount, annual_rate, term, payment_money);
    });
}

LoanConfigurationDifference compare_loan_configurations(const LoanConfiguration& a,
                                                        const LoanConfiguration& b) noexcept {
    return LoanConfigurationDifference{
        .amount_difference = b.amount().to_major() - a.amount().to_major(),
        .rate_difference = b.annual_rate().percent() - a.annual_rate().percent(),
        .term_difference = b.term().value() - a.term().value(),
        .payment_difference = b.monthly_payment().to_major() - a.monthly_payment().to_major()
    };
}

}  // namespace tilgung
