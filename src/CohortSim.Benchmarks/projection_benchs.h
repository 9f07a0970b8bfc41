#pragma once
#include <benchmark/benchmark.h>

#include "CohortSim/cohort_evolution.h"
#include "CohortSim/demographic_rates.h"
#include "CohortSim/economic_metrics.h"
#include "CohortSim/projection.h"
#include "CohortSim/scenario.h"

#include <algorithm>
#include <cmath>
#include <map>
#include <vector>

/* Synthetic reference data shaped like a low fertility European population */

inline csim::ReferenceData create_bench_reference() {
    using namespace csim;
    constexpr auto terminal_age = PopulationSnapshot::terminal_age;

    auto cohorts = std::vector<Cohort>{};
    auto life_table = create_age_gender_table<double>(core::IntegerInterval{0, terminal_age});
    auto employment = std::map<int, double>{};
    for (auto age = 0; age <= terminal_age; age++) {
        auto count = static_cast<int>(60000.0 * std::exp(-0.0004 * (age - 45) * (age - 45)));
        cohorts.emplace_back(Cohort{.age = age, .males = count, .females = count + count / 20});

        auto qx = age == terminal_age ? 1.0 : std::min(0.6, 0.0002 + 2.5e-5 * std::exp(0.1 * age));
        life_table.at(age, core::Gender::male) = qx;
        life_table.at(age, core::Gender::female) = qx * 0.7;
        employment.emplace(age, age >= 15 && age < 65 ? 0.75 : 0.0);
    }

    auto fertility = std::map<int, double>{};
    for (auto age = 15; age <= 49; age++) {
        fertility.emplace(age, 0.04 * std::exp(-0.01 * (age - 31) * (age - 31)));
    }

    auto migration = std::vector<MigrationBand>{
        {.ages = core::IntegerInterval{0, 19}, .weight = DoubleGenderValue{0.10, 0.10}},
        {.ages = core::IntegerInterval{20, 44}, .weight = DoubleGenderValue{0.65, 0.65}},
        {.ages = core::IntegerInterval{45, 99}, .weight = DoubleGenderValue{0.25, 0.25}}};

    auto healthcare = std::vector<HealthcareBand>{
        {.ages = core::IntegerInterval{0, 14}, .multiplier = 0.6},
        {.ages = core::IntegerInterval{15, 64}, .multiplier = 1.0},
        {.ages = core::IntegerInterval{65, terminal_age}, .multiplier = 3.5}};

    auto economy = EconomicAssumptions{.average_salary = 20580.0,
                                       .contribution_rate = 0.3475,
                                       .average_pension = 7820.0,
                                       .healthcare_cost_per_capita = 2310.0,
                                       .healthcare_public_share = 0.63,
                                       .gdp_per_worker = 55400.0,
                                       .wage_growth = 0.01,
                                       .pension_growth = 0.01,
                                       .healthcare_growth = 0.015};

    return ReferenceData{PopulationSnapshot{std::move(cohorts)},
                         std::move(life_table),
                         std::move(fertility),
                         std::move(migration),
                         std::move(employment),
                         std::move(healthcare),
                         DemographicConstants{},
                         economy};
}

static const auto bench_reference = create_bench_reference();

static void projection_full_century(benchmark::State &state, csim::ScenarioType type) {
    auto parameters = csim::create_scenario_parameters(type, 66);
    for (auto _ : state) {
        auto records = csim::project(bench_reference, 2024, 2100, parameters);
        benchmark::DoNotOptimize(records);
    }
}

static void cohort_evolution_step(benchmark::State &state) {
    auto rates = csim::DemographicRates{bench_reference};
    auto evolution = csim::CohortEvolution{rates};
    auto parameters = csim::SimulationParameters{};
    for (auto _ : state) {
        auto result = evolution.evolve(bench_reference.baseline(), 10, parameters);
        benchmark::DoNotOptimize(result);
    }
}

static void economic_metrics_year(benchmark::State &state) {
    auto rates = csim::DemographicRates{bench_reference};
    auto calculator = csim::EconomicCalculator{rates};
    for (auto _ : state) {
        auto metrics = calculator.calculate(bench_reference.baseline(), 66, 10, 0, 0.0);
        benchmark::DoNotOptimize(metrics);
    }
}

BENCHMARK_CAPTURE(projection_full_century, low_scenario, csim::ScenarioType::low);
BENCHMARK_CAPTURE(projection_full_century, medium_scenario, csim::ScenarioType::medium);
BENCHMARK_CAPTURE(projection_full_century, high_scenario, csim::ScenarioType::high);

BENCHMARK(cohort_evolution_step);
BENCHMARK(economic_metrics_year);
