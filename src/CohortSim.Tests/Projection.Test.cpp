#include "pch.h"

#include "CohortSim/event_bus.h"
#include "CohortSim/info_message.h"
#include "CohortSim/projection.h"
#include "reference_fixture.h"

#include <atomic>

TEST(TestCohortSim_Projection, FirstRecordIsBaseline) {
    using namespace csim;

    auto reference = create_test_reference();
    auto records = project(reference, 2024, 2034, SimulationParameters{});

    ASSERT_EQ(11, records.size());
    ASSERT_EQ(2024, records.front().year);
    ASSERT_EQ(2034, records.back().year);
    ASSERT_EQ(reference.baseline(), records.front().population);
    ASSERT_EQ(reference.baseline().total(), records.front().summary.total_population);

    for (std::size_t index = 1; index < records.size(); index++) {
        ASSERT_EQ(records[index - 1].year + 1, records[index].year);
    }
}

TEST(TestCohortSim_Projection, SingleYearHasNoEvolution) {
    using namespace csim;

    auto reference = create_test_reference();
    auto records = project(reference, 2024, 2024, SimulationParameters{});

    ASSERT_EQ(1, records.size());
    ASSERT_EQ(reference.baseline(), records.front().population);
}

TEST(TestCohortSim_Projection, RecordsAreConsistent) {
    using namespace csim;

    auto reference = create_test_reference();
    auto parameters = SimulationParameters{.retirement_age = 67};
    auto records = project(reference, 2024, 2100, parameters);

    ASSERT_EQ(77, records.size());
    for (const auto &record : records) {
        const auto &summary = record.summary;
        ASSERT_EQ(record.population.total(), summary.total_population);
        ASSERT_EQ(summary.total_population, summary.child_population +
                                                summary.working_population +
                                                summary.retired_population);
        ASSERT_DOUBLE_EQ(static_cast<double>(summary.retired_population) * 100.0 /
                             static_cast<double>(summary.working_population),
                         summary.dependency_ratio);
        ASSERT_GE(record.economics.sustainability_index, 0.0);
        ASSERT_LE(record.economics.sustainability_index, 100.0);
        for (const auto &cohort : record.population) {
            ASSERT_GE(cohort.males, 0);
            ASSERT_GE(cohort.females, 0);
        }
    }
}

TEST(TestCohortSim_Projection, NoBirthsNoMigrationNeverGrows) {
    using namespace csim;

    auto reference = create_test_reference();
    auto parameters = SimulationParameters{.fertility_rate = 0.0, .net_migration = 0};
    auto records = project(reference, 2024, 2060, parameters);

    for (std::size_t index = 1; index < records.size(); index++) {
        ASSERT_LE(records[index].population.total(), records[index - 1].population.total());
    }

    ASSERT_LT(records.back().population.total(), records.front().population.total());
}

TEST(TestCohortSim_Projection, ProjectionIsDeterministic) {
    using namespace csim;

    auto reference = create_test_reference();
    auto first = project(reference, 2024, 2050, SimulationParameters{});
    auto second = project(reference, 2024, 2050, SimulationParameters{});

    ASSERT_EQ(first.size(), second.size());
    for (std::size_t index = 0; index < first.size(); index++) {
        ASSERT_EQ(first[index].population, second[index].population);
        ASSERT_EQ(first[index].economics.sustainability_index,
                  second[index].economics.sustainability_index);
    }
}

TEST(TestCohortSim_Projection, InvalidParametersThrowBeforeRunning) {
    using namespace csim;

    auto reference = create_test_reference();
    auto driver = ProjectionDriver{reference};

    ASSERT_EQ(ProjectionState::validating, driver.state());
    ASSERT_THROW(driver.run(2024, 2100, SimulationParameters{.retirement_age = 50}),
                 ParameterError);
    ASSERT_EQ(ProjectionState::validating, driver.state());
    ASSERT_THROW(driver.run(2100, 2024, SimulationParameters{}), ParameterError);
}

TEST(TestCohortSim_Projection, DriverPublishesProgress) {
    using namespace csim;

    auto reference = create_test_reference();
    auto bus = std::make_shared<DefaultEventBus>();
    auto start_count = std::atomic<int>{0};
    auto update_count = std::atomic<int>{0};
    auto stop_count = std::atomic<int>{0};
    auto warning_count = std::atomic<int>{0};

    auto info_handler = bus->subscribe(EventType::info, [&](std::shared_ptr<EventMessage> m) {
        const auto *info = dynamic_cast<const InfoEventMessage *>(m.get());
        ASSERT_NE(nullptr, info);
        switch (info->model_action) {
        case ModelAction::start:
            start_count++;
            break;
        case ModelAction::update:
            update_count++;
            break;
        case ModelAction::stop:
            stop_count++;
            break;
        }
    });

    auto warning_handler = bus->subscribe(EventType::warning, [&](auto &&) { warning_count++; });

    auto driver = ProjectionDriver{reference, bus, BalanceValidator{0.0}, "Medium"};
    auto records = driver.run(2024, 2034, SimulationParameters{});

    ASSERT_EQ("Medium", driver.name());
    ASSERT_EQ(ProjectionState::complete, driver.state());
    ASSERT_EQ(11, records.size());
    ASSERT_EQ(1, start_count.load());
    ASSERT_EQ(10, update_count.load());
    ASSERT_EQ(1, stop_count.load());
    ASSERT_EQ(0, warning_count.load());
    ASSERT_TRUE(driver.balance_failures().empty());
}
