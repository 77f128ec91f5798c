// SPDX-License-Identifier: MIT
#include "tilgung/amortization/amortization_engine.hpp"
#include "tilgung/analytics/sondertilgung_analytics.hpp"
#include "tilgung/loan/loan_calculations.hpp"
#include <benchmark/benchmark.h>
#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

using namespace tilgung;

namespace {

constexpr int kWarmupIterations = 5;
constexpr double kMinBenchmarkTimeSec = 1.0;

// ============================================================================
// Golden Values
// ============================================================================
// 300,000 EUR at 3.5% over 30 years, no extra payments
constexpr double GOLDEN_TOTAL_INTEREST_30Y = 184'968.26;
constexpr double GOLDEN_ABS_TOL = 0.02;

inline void validate_amount(const char* benchmark_name, double computed, double expected) {
    if (std::abs(computed - expected) > GOLDEN_ABS_TOL) {
        throw std::runtime_error(std::string(benchmark_name) +
                                 ": validation failed, expected=" + std::to_string(expected) +
                                 " computed=" + std::to_string(computed));
    }
}

LoanConfiguration make_config(double amount, double rate, int64_t months) {
    auto config = LoanConfiguration::with_computed_payment(*Money::from_major(amount),
                                                           *InterestRate::create(rate),
                                                           *MonthCount::create(months));
    if (!config) {
        throw std::runtime_error("Invalid benchmark configuration");
    }
    return *config;
}

ExtraPaymentPlan yearly_plan(int64_t years, double amount) {
    std::vector<ExtraPayment> payments;
    for (int64_t year = 1; year <= years; ++year) {
        payments.push_back(*ExtraPayment::create(year * 12, amount));
    }
    auto plan = ExtraPaymentPlan::create(std::nullopt, payments);
    if (!plan) {
        throw std::runtime_error("Invalid benchmark plan");
    }
    return *plan;
}

}  // namespace

// ============================================================================
// Schedule generation
// ============================================================================

static void BM_GenerateSchedule(benchmark::State& state) {
    const int64_t years = state.range(0);
    auto config = make_config(300'000.0, 3.5, years * 12);

    auto run_once = [&]() {
        auto schedule = generate_schedule(config);
        if (!schedule) {
            throw std::runtime_error("Schedule error code " +
                                     std::to_string(static_cast<int>(schedule.error().code)));
        }
        benchmark::DoNotOptimize(schedule->metrics().total_interest);
        return schedule->metrics().total_interest.to_major();
    };

    for (int i = 0; i < kWarmupIterations; ++i) {
        run_once();
    }
    if (years == 30) {
        validate_amount("BM_GenerateSchedule[30y]", run_once(), GOLDEN_TOTAL_INTEREST_30Y);
    }

    for (auto _ : state) {
        run_once();
    }

    state.SetItemsProcessed(state.iterations() * years * 12);
    state.counters["months"] = static_cast<double>(years * 12);
}
BENCHMARK(BM_GenerateSchedule)
    ->Arg(10)
    ->Arg(25)
    ->Arg(30)
    ->Arg(40)
    ->MinTime(kMinBenchmarkTimeSec);

static void BM_GenerateScheduleWithExtras(benchmark::State& state) {
    auto config = make_config(300'000.0, 3.5, 360);
    auto plan = yearly_plan(30, 5'000.0);

    for (auto _ : state) {
        auto schedule = generate_schedule(config, plan);
        benchmark::DoNotOptimize(schedule);
    }
}
BENCHMARK(BM_GenerateScheduleWithExtras)->MinTime(kMinBenchmarkTimeSec);

// ============================================================================
// Loan algebra
// ============================================================================

static void BM_InterestRateBisection(benchmark::State& state) {
    auto config = make_config(300'000.0, 3.5, 360);

    for (auto _ : state) {
        auto rate = interest_rate(config.amount(), config.monthly_payment(), config.term());
        benchmark::DoNotOptimize(rate);
    }
}
BENCHMARK(BM_InterestRateBisection);

static void BM_MonthlyPayment(benchmark::State& state) {
    auto config = make_config(300'000.0, 3.5, 360);

    for (auto _ : state) {
        auto payment = monthly_payment(config);
        benchmark::DoNotOptimize(payment);
    }
}
BENCHMARK(BM_MonthlyPayment);

// ============================================================================
// Analytics
// ============================================================================

static void BM_CompareStrategies(benchmark::State& state) {
    const size_t n_plans = static_cast<size_t>(state.range(0));
    auto config = make_config(300'000.0, 3.5, 360);

    std::vector<ExtraPaymentPlan> plans;
    plans.reserve(n_plans);
    for (size_t i = 0; i < n_plans; ++i) {
        plans.push_back(yearly_plan(static_cast<int64_t>(i % 30) + 1, 1'000.0 + 250.0 * i));
    }

    for (auto _ : state) {
        auto ranked = compare_strategies(config, plans);
        if (!ranked) {
            throw std::runtime_error("Strategy comparison failed");
        }
        benchmark::DoNotOptimize(ranked);
    }

    state.SetItemsProcessed(state.iterations() * n_plans);
    state.counters["plans"] = static_cast<double>(n_plans);
}
BENCHMARK(BM_CompareStrategies)
    ->Arg(8)
    ->Arg(64)
    ->MinTime(kMinBenchmarkTimeSec);

BENCHMARK_MAIN();
