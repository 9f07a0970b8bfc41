#include "reference_fixture.h"

#include <vector>

using namespace csim;

PopulationSnapshot create_uniform_population(std::int64_t count) {
    auto cohorts = std::vector<Cohort>{};
    for (auto age = 0; age <= PopulationSnapshot::terminal_age; age++) {
        cohorts.emplace_back(Cohort{.age = age, .males = count, .females = count});
    }

    return PopulationSnapshot{std::move(cohorts)};
}

DoubleAgeGenderTable create_life_table(double qx, double terminal_qx) {
    constexpr auto terminal_age = PopulationSnapshot::terminal_age;
    auto table = create_age_gender_table<double>(core::IntegerInterval{0, terminal_age});
    for (auto age = 0; age <= terminal_age; age++) {
        auto value = age == terminal_age ? terminal_qx : qx;
        table.at(age, core::Gender::male) = value;
        table.at(age, core::Gender::female) = value;
    }

    return table;
}

EconomicAssumptions create_test_economy() {
    return EconomicAssumptions{.average_salary = 20000.0,
                               .contribution_rate = 0.3475,
                               .average_pension = 8000.0,
                               .healthcare_cost_per_capita = 2000.0,
                               .healthcare_public_share = 0.6,
                               .gdp_per_worker = 50000.0,
                               .wage_growth = 0.01,
                               .pension_growth = 0.01,
                               .healthcare_growth = 0.015};
}

ReferenceData create_test_reference(std::int64_t count, double qx, double terminal_qx) {
    auto fertility = std::map<int, double>{};
    for (auto age = 15; age <= 49; age++) {
        fertility.emplace(age, 0.04);
    }

    auto migration = std::vector<MigrationBand>{
        {core::IntegerInterval{0, 14}, DoubleGenderValue{0.2, 0.2}},
        {core::IntegerInterval{15, 64}, DoubleGenderValue{0.7, 0.7}},
        {core::IntegerInterval{65, 99}, DoubleGenderValue{0.1, 0.1}}};

    auto employment = std::map<int, double>{};
    for (auto age = 0; age <= PopulationSnapshot::terminal_age; age++) {
        auto rate = 0.0;
        if (age >= 15 && age <= 64) {
            rate = 0.7;
        } else if (age >= 65 && age <= 74) {
            rate = 0.1;
        }

        employment.emplace(age, rate);
    }

    auto healthcare = std::vector<HealthcareBand>{{core::IntegerInterval{0, 14}, 0.5},
                                                  {core::IntegerInterval{15, 64}, 1.0},
                                                  {core::IntegerInterval{65, 100}, 3.0}};

    return ReferenceData{create_uniform_population(count),
                         create_life_table(qx, terminal_qx),
                         std::move(fertility),
                         std::move(migration),
                         std::move(employment),
                         std::move(healthcare),
                         DemographicConstants{},
                         create_test_economy()};
}
