#include "pch.h"

#include "CohortSim/scenario.h"
#include "CohortSim/simulation_parameters.h"

TEST(TestCohortSim_Parameters, DefaultsAreValid) {
    using namespace csim;

    auto parameters = SimulationParameters{};
    ASSERT_EQ(66, parameters.retirement_age);
    ASSERT_EQ(1.40, parameters.fertility_rate);
    ASSERT_EQ(110000, parameters.net_migration);
    ASSERT_EQ(0.010, parameters.mortality_improvement.rate(core::Gender::male));
    ASSERT_EQ(0.008, parameters.mortality_improvement.rate(core::Gender::female));
    ASSERT_EQ(0.0, parameters.mortality_improvement.rate(core::Gender::unknown));
    ASSERT_TRUE(check_parameters(parameters, 2024, 2100).empty());
    ASSERT_NO_THROW(validate_parameters(parameters, 2024, 2100));
}

TEST(TestCohortSim_Parameters, DomainBoundariesAreInclusive) {
    using namespace csim;

    auto parameters = SimulationParameters{.retirement_age = 55,
                                           .fertility_rate = 5.0,
                                           .net_migration = -500000,
                                           .mortality_improvement = {0.0, 0.05},
                                           .entry_age_shift = 10,
                                           .unemployment_adjustment = -0.5};

    ASSERT_TRUE(check_parameters(parameters, 2024, 2024).empty());
}

TEST(TestCohortSim_Parameters, ViolationsAreReported) {
    using namespace csim;

    auto parameters = SimulationParameters{.retirement_age = 81,
                                           .fertility_rate = -0.1,
                                           .net_migration = 500001,
                                           .mortality_improvement = {0.06, -0.01},
                                           .entry_age_shift = -6,
                                           .unemployment_adjustment = 0.6};

    auto violations = check_parameters(parameters, 2100, 2024);
    ASSERT_EQ(8, violations.size());

    try {
        validate_parameters(parameters, 2100, 2024);
        FAIL() << "Expected ParameterError";
    } catch (const ParameterError &ex) {
        ASSERT_EQ(violations, ex.violations());
        ASSERT_NE(std::string::npos, std::string{ex.what()}.find("retirement age"));
    }
}

TEST(TestCohortSim_Parameters, ProjectionSpanIsBounded) {
    using namespace csim;

    auto parameters = SimulationParameters{};
    ASSERT_EQ(200, parameter_domain::max_projection_span);
    ASSERT_TRUE(check_parameters(parameters, 2024, 2224).empty());

    auto violations = check_parameters(parameters, 2024, 2500);
    ASSERT_EQ(1, violations.size());
    ASSERT_NE(std::string::npos, violations.front().find("projection span"));
    ASSERT_THROW(validate_parameters(parameters, 2024, 2225), ParameterError);
}

TEST(TestCohortSim_Parameters, ParameterErrorIsCoreException) {
    using namespace csim;

    auto parameters = SimulationParameters{.retirement_age = 90};
    ASSERT_THROW(validate_parameters(parameters, 2024, 2100), core::CsimException);
}

TEST(TestCohortSim_Scenario, PresetDefinitions) {
    using namespace csim;

    const auto &definitions = get_scenario_definitions();
    ASSERT_EQ(3, definitions.size());

    const auto &low = get_scenario_definition(ScenarioType::low);
    ASSERT_EQ(1.20, low.preset.fertility_rate);
    ASSERT_EQ(50000, low.preset.net_migration);
    ASSERT_EQ(0.005, low.preset.mortality_improvement.male);
    ASSERT_EQ(0.004, low.preset.mortality_improvement.female);
    ASSERT_EQ(1, low.preset.entry_age_shift);
    ASSERT_EQ(0.02, low.preset.unemployment_adjustment);

    const auto &high = get_scenario_definition(ScenarioType::high);
    ASSERT_EQ(1.77, high.preset.fertility_rate);
    ASSERT_EQ(150000, high.preset.net_migration);
    ASSERT_EQ(-1, high.preset.entry_age_shift);

    ASSERT_THROW(get_scenario_definition(ScenarioType::custom), std::invalid_argument);
}

TEST(TestCohortSim_Scenario, CreateParameters) {
    using namespace csim;

    auto medium = create_scenario_parameters(ScenarioType::medium, 67);
    ASSERT_EQ(67, medium.retirement_age);
    ASSERT_EQ(1.40, medium.fertility_rate);
    ASSERT_EQ(110000, medium.net_migration);
    ASSERT_EQ(0, medium.entry_age_shift);

    for (const auto &definition : get_scenario_definitions()) {
        auto parameters = create_scenario_parameters(definition.type, 66);
        ASSERT_TRUE(check_parameters(parameters, 2024, 2100).empty()) << definition.name;
    }
}

TEST(TestCohortSim_Scenario, CreateCustomParameters) {
    using namespace csim;

    auto preset = ScenarioPreset{.fertility_rate = 2.1,
                                 .net_migration = -20000,
                                 .mortality_improvement = {0.02, 0.02},
                                 .entry_age_shift = 3,
                                 .unemployment_adjustment = 0.1};

    auto custom = create_scenario_parameters(ScenarioType::custom, 70, preset);
    ASSERT_EQ(70, custom.retirement_age);
    ASSERT_EQ(2.1, custom.fertility_rate);
    ASSERT_EQ(-20000, custom.net_migration);
    ASSERT_EQ(3, custom.entry_age_shift);
    ASSERT_EQ(0.1, custom.unemployment_adjustment);

    ASSERT_THROW(create_scenario_parameters(ScenarioType::custom, 66), std::invalid_argument);
}

TEST(TestCohortSim_Scenario, ParseScenarioType) {
    using namespace csim;

    ASSERT_EQ(ScenarioType::low, parse_scenario_type("low"));
    ASSERT_EQ(ScenarioType::medium, parse_scenario_type("Medium"));
    ASSERT_EQ(ScenarioType::high, parse_scenario_type("HIGH"));
    ASSERT_EQ(ScenarioType::custom, parse_scenario_type("custom"));
    ASSERT_THROW(parse_scenario_type("baseline"), std::invalid_argument);

    for (auto type : {ScenarioType::low, ScenarioType::medium, ScenarioType::high}) {
        ASSERT_EQ(type, parse_scenario_type(to_string(type)));
    }
}
