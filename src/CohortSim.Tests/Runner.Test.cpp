#include "pch.h"

#include "CohortSim/event_bus.h"
#include "CohortSim/projection.h"
#include "CohortSim/runner.h"
#include "CohortSim/runner_message.h"
#include "CohortSim/scenario.h"
#include "reference_fixture.h"

#include <atomic>

namespace {
std::vector<csim::ScenarioRun> create_preset_runs() {
    using namespace csim;

    auto runs = std::vector<ScenarioRun>{};
    for (const auto &definition : get_scenario_definitions()) {
        runs.emplace_back(
            ScenarioRun{definition.name, create_scenario_parameters(definition.type, 66)});
    }

    return runs;
}
} // anonymous namespace

TEST(TestCohortSim_Runner, RunScenariosInParallel) {
    using namespace csim;

    auto reference = create_test_reference();
    auto bus = std::make_shared<DefaultEventBus>();
    auto runner_count = std::atomic<int>{0};
    auto handler = bus->subscribe(EventType::runner, [&](auto &&) { runner_count++; });

    auto runner = Runner{bus};
    auto scenarios = create_preset_runs();
    auto results = runner.run(reference, 2024, 2060, scenarios);

    ASSERT_FALSE(runner.is_running());
    ASSERT_EQ(scenarios.size(), results.size());

    // start, begin and end of each run, finish
    ASSERT_EQ(2 + 2 * static_cast<int>(scenarios.size()), runner_count.load());

    for (std::size_t index = 0; index < results.size(); index++) {
        const auto &result = results[index];
        ASSERT_EQ(scenarios[index].name, result.name);
        ASSERT_EQ(37, result.records.size());
        ASSERT_TRUE(result.balance_failures.empty());
        ASSERT_GE(result.elapsed_ms, 0.0);

        auto expected = project(reference, 2024, 2060, scenarios[index].parameters);
        for (std::size_t year = 0; year < expected.size(); year++) {
            ASSERT_EQ(expected[year].population, result.records[year].population);
        }
    }
}

TEST(TestCohortSim_Runner, HigherScenarioGrowsFaster) {
    using namespace csim;

    auto reference = create_test_reference();
    auto runner = Runner{std::shared_ptr<EventAggregator>{}};
    auto results = runner.run(reference, 2024, 2050, create_preset_runs());

    ASSERT_EQ(3, results.size());
    ASSERT_EQ("Low", results[0].name);
    ASSERT_EQ("High", results[2].name);
    ASSERT_LT(results[0].records.back().population.total(),
              results[1].records.back().population.total());
    ASSERT_LT(results[1].records.back().population.total(),
              results[2].records.back().population.total());
}

TEST(TestCohortSim_Runner, EmptyScenariosThrow) {
    using namespace csim;

    auto reference = create_test_reference();
    auto runner = Runner{std::make_shared<DefaultEventBus>()};

    ASSERT_THROW(runner.run(reference, 2024, 2100, {}), std::invalid_argument);
    ASSERT_FALSE(runner.is_running());
}

TEST(TestCohortSim_Runner, InvalidScenarioFailsBeforeStart) {
    using namespace csim;

    auto reference = create_test_reference();
    auto bus = std::make_shared<DefaultEventBus>();
    auto runner_count = std::atomic<int>{0};
    auto handler = bus->subscribe(EventType::runner, [&](auto &&) { runner_count++; });

    auto scenarios = create_preset_runs();
    scenarios[1].parameters.fertility_rate = 6.0;

    auto runner = Runner{bus};
    ASSERT_THROW(runner.run(reference, 2024, 2100, scenarios), ParameterError);
    ASSERT_EQ(0, runner_count.load());
    ASSERT_FALSE(runner.is_running());
}
