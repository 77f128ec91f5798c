// SPDX-License-Identifier: MIT
/**
 * @file loan_configuration.hpp
 * @brief Validated loan parameters (amount, rate, term, payment)
 */

#pragma once

#include "tilgung/support/error_types.hpp"
#include "tilgung/support/precision.hpp"
#include "tilgung/value/interest_rate.hpp"
#include "tilgung/value/money.hpp"
#include "tilgung/value/month.hpp"
#include <cstdint>
#include <expected>
#include <optional>

namespace tilgung {

/// Raw loan parameters as entered by a user
///
/// The term may be given in months or years. Months win when both are set.
struct LoanConfigurationInput {
    std::optional<double> amount;             ///< Major units
    std::optional<double> annual_rate;        ///< Percent (3.5 = 3.5%)
    std::optional<int64_t> term_in_months;
    std::optional<double> term_in_years;
    std::optional<double> monthly_payment;    ///< Major units
};

/// Differences b - a between two configurations
struct LoanConfigurationDifference {
    double amount_difference;
    double rate_difference;       ///< Percentage points
    int64_t term_difference;      ///< Months
    double payment_difference;
};

/**
 * @brief Immutable loan configuration
 *
 * The four fields must satisfy the annuity formula within tolerance
 * (1.00 EUR, or 0.01 EUR at a zero rate). Construct through create(),
 * from_input() or with_computed_payment().
 */
class LoanConfiguration {
public:
    /// Smallest and largest loan amounts accepted from raw input (EUR)
    static constexpr double kMinLoanAmount = 1'000.0;
    static constexpr double kMaxLoanAmount = 10'000'000.0;

    static std::expected<LoanConfiguration, ValidationError>
    create(Money amount, InterestRate annual_rate, MonthCount term, Money monthly_payment,
           const PrecisionConfig& precision = {}) noexcept;

    static std::expected<LoanConfiguration, ValidationError>
    from_input(const LoanConfigurationInput& input,
               const PrecisionConfig& precision = {}) noexcept;

    /// Configuration whose payment is the annuity payment rounded to cents
    static std::expected<LoanConfiguration, ValidationError>
    with_computed_payment(Money amount, InterestRate annual_rate, MonthCount term) noexcept;

    Money amount() const noexcept { return amount_; }
    InterestRate annual_rate() const noexcept { return annual_rate_; }
    MonthCount term() const noexcept { return term_; }
    Money monthly_payment() const noexcept { return monthly_payment_; }

private:
    LoanConfiguration(Money amount, InterestRate annual_rate, MonthCount term,
                      Money monthly_payment) noexcept
        : amount_(amount)
        , annual_rate_(annual_rate)
        , term_(term)
        , monthly_payment_(monthly_payment) {}

    Money amount_;
    InterestRate annual_rate_;
    MonthCount term_;
    Money monthly_payment_;
};

LoanConfigurationDifference compare_loan_configurations(const LoanConfiguration& a,
                                                        const LoanConfiguration& b) noexcept;

}  // namespace tilgung
