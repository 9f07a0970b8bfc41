#include "pch.h"

#include "CohortSim/reference_data.h"
#include "reference_fixture.h"

namespace {
using namespace csim;

/// @brief Builds reference tables that can be modified before construction
struct ReferenceInputs {
    std::map<int, double> fertility{{20, 0.5}, {30, 0.9}};
    std::vector<MigrationBand> migration{
        {core::IntegerInterval{0, 49}, DoubleGenderValue{0.5, 0.5}},
        {core::IntegerInterval{50, 99}, DoubleGenderValue{0.5, 0.5}}};
    std::map<int, double> employment{{30, 0.8}};
    std::vector<HealthcareBand> healthcare{{core::IntegerInterval{0, 100}, 1.0}};
    DemographicConstants demographic{};
    EconomicAssumptions economy = create_test_economy();
    double qx = 0.01;
    double terminal_qx = 1.0;

    ReferenceData create() const {
        return ReferenceData{create_uniform_population(10),
                             create_life_table(qx, terminal_qx),
                             fertility,
                             migration,
                             employment,
                             healthcare,
                             demographic,
                             economy};
    }
};
} // anonymous namespace

TEST(TestCohortSim_ReferenceData, CreateValid) {
    auto inputs = ReferenceInputs{};
    auto reference = inputs.create();

    ASSERT_EQ(2020, reference.baseline().total());
    ASSERT_EQ(2, reference.fertility().size());
    ASSERT_EQ(2, reference.migration().size());
    ASSERT_EQ(1.05, reference.demographic().sex_ratio_at_birth);
    ASSERT_EQ(0.48, reference.demographic().migration_male_share);
    ASSERT_EQ(20000.0, reference.economy().average_salary);
    ASSERT_EQ(1.0, reference.life_table().at(100, core::Gender::male));
}

TEST(TestCohortSim_ReferenceData, CreateFixture) {
    auto reference = create_test_reference();

    ASSERT_EQ(202000, reference.baseline().total());
    ASSERT_EQ(35, reference.fertility().size());
    ASSERT_EQ(101, reference.employment().size());
}

TEST(TestCohortSim_ReferenceData, LifeTableMustCoverTerminalAge) {
    auto inputs = ReferenceInputs{};
    auto table = create_age_gender_table<double>(core::IntegerInterval{0, 99});

    ASSERT_THROW(ReferenceData(create_uniform_population(10), std::move(table), inputs.fertility,
                               inputs.migration, inputs.employment, inputs.healthcare,
                               inputs.demographic, inputs.economy),
                 std::invalid_argument);
}

TEST(TestCohortSim_ReferenceData, LifeTableOutOfRangeThrows) {
    auto inputs = ReferenceInputs{};
    inputs.qx = 1.2;
    ASSERT_THROW(inputs.create(), std::invalid_argument);

    inputs.qx = -0.01;
    ASSERT_THROW(inputs.create(), std::invalid_argument);
}

TEST(TestCohortSim_ReferenceData, FertilityValidation) {
    auto inputs = ReferenceInputs{};
    inputs.fertility[12] = 0.1;
    ASSERT_THROW(inputs.create(), std::invalid_argument);

    inputs = ReferenceInputs{};
    inputs.fertility[25] = -0.1;
    ASSERT_THROW(inputs.create(), std::invalid_argument);

    inputs = ReferenceInputs{};
    inputs.fertility.clear();
    ASSERT_THROW(inputs.create(), std::invalid_argument);
}

TEST(TestCohortSim_ReferenceData, MigrationValidation) {
    auto inputs = ReferenceInputs{};
    inputs.migration.push_back({core::IntegerInterval{90, 100}, DoubleGenderValue{0.1, 0.1}});
    ASSERT_THROW(inputs.create(), std::invalid_argument);

    inputs = ReferenceInputs{};
    inputs.migration.push_back({core::IntegerInterval{40, 60}, DoubleGenderValue{0.1, 0.1}});
    ASSERT_THROW(inputs.create(), std::invalid_argument);

    inputs = ReferenceInputs{};
    inputs.migration[0].weight.males = -0.5;
    ASSERT_THROW(inputs.create(), std::invalid_argument);

    inputs = ReferenceInputs{};
    for (auto &band : inputs.migration) {
        band.weight.females = 0.0;
    }
    ASSERT_THROW(inputs.create(), std::invalid_argument);
}

TEST(TestCohortSim_ReferenceData, EmploymentValidation) {
    auto inputs = ReferenceInputs{};
    inputs.employment[40] = 1.1;
    ASSERT_THROW(inputs.create(), std::invalid_argument);

    inputs = ReferenceInputs{};
    inputs.employment[101] = 0.1;
    ASSERT_THROW(inputs.create(), std::invalid_argument);
}

TEST(TestCohortSim_ReferenceData, HealthcareValidation) {
    auto inputs = ReferenceInputs{};
    inputs.healthcare.push_back({core::IntegerInterval{65, 100}, 2.0});
    ASSERT_THROW(inputs.create(), std::invalid_argument);

    inputs = ReferenceInputs{};
    inputs.healthcare[0].multiplier = -1.0;
    ASSERT_THROW(inputs.create(), std::invalid_argument);
}

TEST(TestCohortSim_ReferenceData, ConstantsValidation) {
    auto inputs = ReferenceInputs{};
    inputs.demographic.sex_ratio_at_birth = 0.0;
    ASSERT_THROW(inputs.create(), std::invalid_argument);

    inputs = ReferenceInputs{};
    inputs.demographic.migration_male_share = 1.5;
    ASSERT_THROW(inputs.create(), std::invalid_argument);

    inputs = ReferenceInputs{};
    inputs.economy.contribution_rate = 1.2;
    ASSERT_THROW(inputs.create(), std::invalid_argument);

    inputs = ReferenceInputs{};
    inputs.economy.average_pension = -1.0;
    ASSERT_THROW(inputs.create(), std::invalid_argument);
}
