#include "pch.h"

#include "CohortSim/demographic_rates.h"
#include "reference_fixture.h"

#include <cmath>

class DemographicRatesFixture : public ::testing::Test {
  protected:
    csim::ReferenceData reference = create_test_reference();
    csim::DemographicRates rates{reference};
    csim::MortalityImprovement no_improvement{0.0, 0.0};
};

TEST_F(DemographicRatesFixture, MortalityBaseRate) {
    using namespace csim;

    ASSERT_DOUBLE_EQ(0.01, rates.mortality_probability(0, core::Gender::male, 0, no_improvement));
    ASSERT_DOUBLE_EQ(0.01,
                     rates.mortality_probability(99, core::Gender::female, 20, no_improvement));
    ASSERT_EQ(0.0, rates.mortality_probability(-1, core::Gender::male, 0, no_improvement));
}

TEST_F(DemographicRatesFixture, MortalityImprovementCompounds) {
    using namespace csim;
    auto improvement = MortalityImprovement{0.02, 0.01};

    auto male = rates.mortality_probability(40, core::Gender::male, 10, improvement);
    auto female = rates.mortality_probability(40, core::Gender::female, 10, improvement);

    ASSERT_DOUBLE_EQ(0.01 * std::pow(0.98, 10), male);
    ASSERT_DOUBLE_EQ(0.01 * std::pow(0.99, 10), female);
    ASSERT_LT(male, female);
}

TEST_F(DemographicRatesFixture, MortalityTerminalAgeKeepsTableValue) {
    using namespace csim;
    auto improvement = MortalityImprovement{0.05, 0.05};

    ASSERT_DOUBLE_EQ(0.5, rates.mortality_probability(100, core::Gender::male, 50, improvement));
    ASSERT_DOUBLE_EQ(0.5, rates.mortality_probability(104, core::Gender::female, 9, improvement));
}

TEST_F(DemographicRatesFixture, MortalityLookupIsIdempotent) {
    using namespace csim;
    auto improvement = MortalityImprovement{0.01, 0.008};

    auto first = rates.mortality_probability(70, core::Gender::female, 30, improvement);
    auto second = rates.mortality_probability(70, core::Gender::female, 30, improvement);
    ASSERT_EQ(first, second);
}

TEST_F(DemographicRatesFixture, FertilityRate) {
    ASSERT_NEAR(1.40, rates.baseline_tfr(), 1e-12);
    ASSERT_EQ(0.0, rates.fertility_rate(14));
    ASSERT_EQ(0.04, rates.fertility_rate(15));
    ASSERT_EQ(0.04, rates.fertility_rate(49));
    ASSERT_EQ(0.0, rates.fertility_rate(50));
}

TEST_F(DemographicRatesFixture, MigrationWeightsSumToOne) {
    using namespace csim;

    for (auto gender : {core::Gender::male, core::Gender::female}) {
        auto sum = 0.0;
        for (auto age = 0; age < PopulationSnapshot::terminal_age; age++) {
            sum += rates.migration_weight(age, gender);
        }

        ASSERT_NEAR(1.0, sum, 1e-12);
    }

    ASSERT_DOUBLE_EQ(0.2 / 15.0, rates.migration_weight(5, core::Gender::male));
    ASSERT_DOUBLE_EQ(0.7 / 50.0, rates.migration_weight(30, core::Gender::female));
    ASSERT_EQ(0.0, rates.migration_weight(100, core::Gender::male));
}

TEST_F(DemographicRatesFixture, EmploymentRate) {
    ASSERT_EQ(0.0, rates.employment_rate(10, 0, 0.0));
    ASSERT_EQ(0.0, rates.employment_rate(10, -5, 0.0));
    ASSERT_DOUBLE_EQ(0.7, rates.employment_rate(30, 0, 0.0));
    ASSERT_DOUBLE_EQ(0.1, rates.employment_rate(70, 0, 0.0));
    ASSERT_EQ(0.0, rates.employment_rate(80, 0, 0.0));
}

TEST_F(DemographicRatesFixture, EmploymentEntryShift) {
    // Effective age is clamped at 15
    ASSERT_DOUBLE_EQ(0.7, rates.employment_rate(16, 5, 0.0));

    // Shifted to the right, age 66 reads the age 64 rate
    ASSERT_DOUBLE_EQ(0.7, rates.employment_rate(66, 2, 0.0));

    // Shifted to the left, age 62 reads the age 67 rate
    ASSERT_DOUBLE_EQ(0.1, rates.employment_rate(62, -5, 0.0));

    // Beyond the table
    ASSERT_EQ(0.0, rates.employment_rate(100, -5, 0.0));
}

TEST_F(DemographicRatesFixture, EmploymentUnemploymentAdjustmentClamps) {
    ASSERT_DOUBLE_EQ(0.63, rates.employment_rate(30, 0, 0.1));
    ASSERT_DOUBLE_EQ(0.15, rates.employment_rate(70, 0, -0.5));
    ASSERT_DOUBLE_EQ(1.0, rates.employment_rate(30, 0, -0.5));
    ASSERT_DOUBLE_EQ(0.35, rates.employment_rate(30, 0, 0.5));
}

TEST_F(DemographicRatesFixture, HealthcareMultiplier) {
    ASSERT_EQ(0.5, rates.healthcare_multiplier(0));
    ASSERT_EQ(1.0, rates.healthcare_multiplier(40));
    ASSERT_EQ(3.0, rates.healthcare_multiplier(100));
    ASSERT_EQ(0.0, rates.healthcare_multiplier(101));
}
