// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <variant>

namespace tilgung {

/// Error codes for value construction and configuration validation
enum class ValidationErrorCode {
    NegativeAmount,
    InvalidAmount,
    ExceedsMaximum,
    InvalidInterestRate,
    InvalidTerm,
    InvalidPaymentMonth,
    InvalidPercentage,
    PercentageOutOfRange,
    InvalidExtraPayment,
    MonthMismatch,
    InvalidLoanAmount,
    InvalidMonthlyPayment,
    InconsistentParameters,
    InvalidDecomposition
};

/// Detailed validation error for rejected inputs
struct ValidationError {
    ValidationErrorCode code;
    double value;  // The rejected value
    size_t index;  // Position in a sequence (0 if not applicable)

    ValidationError(ValidationErrorCode code,
                    double value = 0.0,
                    size_t index = 0)
        : code(code), value(value), index(index) {}
};

/// Integer overflow in checked minor-unit arithmetic
struct OverflowError {
    int64_t lhs;
    int64_t rhs;
};

/// Loan algebra failure categories
enum class LoanErrorCode {
    InvalidParameters,
    InsufficientPayment,
    MathematicalError,
    PaymentTooHigh,
    InvalidLoanConfiguration
};

/// Loan algebra error with solver diagnostics
struct LoanError {
    LoanErrorCode code;
    double value = 0.0;     ///< Offending input or last residual
    size_t iterations = 0;  ///< Bisection iterations before failure
    size_t index = 0;       ///< Position within a batch (0 if not applicable)
};

/// Amortization engine failure categories
enum class AmortizationErrorCode {
    PaymentMonthCreation,
    MoneyCreation,
    MonthlyPaymentCalculation,
    PercentageValidation,
    RemainingMonthsCalculation,
    ScheduleAnalysis,
    SafetyLimitExceeded,
    EntryNotFound
};

/// Engine error carrying the simulation state at the point of failure
struct AmortizationError {
    AmortizationErrorCode code;
    std::string operation;        ///< Name of the failed sub-operation
    size_t month = 0;             ///< Simulated month (0 before the loop)
    double balance = 0.0;         ///< Running balance in major units
    std::optional<double> value;  ///< Value that failed construction
};

/// Analytics failure categories
enum class AnalyticsErrorCode {
    ScheduleFailed,
    LoanCalculationFailed,
    InvalidAdjustment
};

/// Analytics error pointing at the offending plan or scenario
struct AnalyticsError {
    AnalyticsErrorCode code;
    size_t index = 0;  ///< Plan or adjustment index within a batch
    std::variant<std::monostate, ValidationError, LoanError, AmortizationError> cause;
};

/// Combined error type that can hold any of our specific error types
using ErrorVariant = std::variant<
    ValidationError,
    LoanError,
    AmortizationError,
    AnalyticsError,
    std::string  // Generic error message
>;

/// Get error code as integer for diagnostics
inline int error_code(const ErrorVariant& error) {
    return std::visit([](const auto& e) -> int {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return -1;  // Generic string error
        } else {
            return static_cast<int>(e.code);
        }
    }, error);
}

/// Map a value construction failure into an engine error
inline AmortizationError convert_to_amortization_error(
    const ValidationError& err, const std::string& operation,
    size_t month, double balance)
{
    AmortizationErrorCode code;
    switch (err.code) {
        case ValidationErrorCode::InvalidPaymentMonth:
            code = AmortizationErrorCode::PaymentMonthCreation;
            break;
        case ValidationErrorCode::InvalidPercentage:
        case ValidationErrorCode::PercentageOutOfRange:
            code = AmortizationErrorCode::PercentageValidation;
            break;
        case ValidationErrorCode::InvalidTerm:
            code = AmortizationErrorCode::RemainingMonthsCalculation;
            break;
        default:
            code = AmortizationErrorCode::MoneyCreation;
            break;
    }
    return AmortizationError{
        .code = code,
        .operation = operation,
        .month = month,
        .balance = balance,
        .value = err.value
    };
}

/// Map a loan algebra failure into an engine error
inline AmortizationError convert_to_amortization_error(
    const LoanError& err, const std::string& operation)
{
    return AmortizationError{
        .code = AmortizationErrorCode::MonthlyPaymentCalculation,
        .operation = operation,
        .month = 0,
        .balance = 0.0,
        .value = err.value
    };
}

/// Output stream operator for ValidationError
inline std::ostream& operator<<(std::ostream& os, const ValidationError& err) {
    os << "ValidationError{code=" << static_cast<int>(err.code)
       << ", value=" << err.value
       << ", index=" << err.index << "}";
    return os;
}

/// Output stream operator for LoanError
inline std::ostream& operator<<(std::ostream& os, const LoanError& err) {
    os << "LoanError{code=" << static_cast<int>(err.code)
       << ", value=" << err.value
       << ", iterations=" << err.iterations
       << ", index=" << err.index << "}";
    return os;
}

/// Output stream operator for AmortizationError
inline std::ostream& operator<<(std::ostream& os, const AmortizationError& err) {
    os << "AmortizationError{code=" << static_cast<int>(err.code)
       << ", operation=" << err.operation
       << ", month=" << err.month
       << ", balance=" << err.balance;
    if (err.value) {
        os << ", value=" << *err.value;
    }
    os << "}";
    return os;
}

/// Output stream operator for AnalyticsError
inline std::ostream& operator<<(std::ostream& os, const AnalyticsError& err) {
    os << "AnalyticsError{code=" << static_cast<int>(err.code)
       << ", index=" << err.index;
    if (const auto* validation = std::get_if<ValidationError>(&err.cause)) {
        os << ", cause=" << *validation;
    } else if (const auto* loan = std::get_if<LoanError>(&err.cause)) {
        os << ", cause=" << *loan;
    } else if (const auto* amort = std::get_if<AmortizationError>(&err.cause)) {
        os << ", cause=" << *amort;
    }
    os << "}";
    return os;
}

} // namespace tilgung
