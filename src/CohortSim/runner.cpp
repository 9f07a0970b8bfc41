#include "runner.h"
#include "error_message.h"
#include "finally.h"
#include "projection.h"
#include "runner_message.h"

#include <chrono>
#include <fmt/format.h>
#include <oneapi/tbb/parallel_for_each.h>
#include <numeric>

namespace csim {

using ElapsedTime = std::chrono::duration<double, std::milli>;

Runner::Runner(std::shared_ptr<EventAggregator> bus, double balance_tolerance) noexcept
    : running_{false}, event_bus_{std::move(bus)}, balance_tolerance_{balance_tolerance} {}

std::vector<ScenarioResult> Runner::run(const ReferenceData &reference, int start_year,
                                        int end_year, const std::vector<ScenarioRun> &scenarios) {
    if (scenarios.empty()) {
        throw std::invalid_argument("The experiment must have at least one scenario.");
    }

    if (running_.exchange(true)) {
        throw std::invalid_argument("The runner is already evaluating an experiment.");
    }

    auto reset = make_finally([this]() noexcept { running_.store(false); });

    // Fail fast, before any scenario starts.
    for (const auto &scenario : scenarios) {
        validate_parameters(scenario.parameters, start_year, end_year);
    }

    auto start = std::chrono::steady_clock::now();
    notify(std::make_unique<RunnerEventMessage>(runner_id_, RunnerAction::start));

    auto results = std::vector<ScenarioResult>(scenarios.size());
    auto indices = std::vector<std::size_t>(scenarios.size());
    std::iota(indices.begin(), indices.end(), std::size_t{0});
    tbb::parallel_for_each(indices.begin(), indices.end(), [&](std::size_t index) {
        const auto &scenario = scenarios[index];
        auto run_number = static_cast<unsigned int>(index + 1);
        auto sender = fmt::format("{} - {}", runner_id_, scenario.name);
        auto run_start = std::chrono::steady_clock::now();
        notify(std::make_unique<RunnerEventMessage>(sender, RunnerAction::run_begin, run_number,
                                                    0.0));

        auto driver = ProjectionDriver{reference, event_bus_, BalanceValidator{balance_tolerance_},
                                       scenario.name};
        try {
            auto &result = results[index];
            result.name = scenario.name;
            result.parameters = scenario.parameters;
            result.records = driver.run(start_year, end_year, scenario.parameters, run_number);
            result.balance_failures = driver.balance_failures();

            ElapsedTime elapsed = std::chrono::steady_clock::now() - run_start;
            result.elapsed_ms = elapsed.count();
            notify(std::make_unique<RunnerEventMessage>(sender, RunnerAction::run_end, run_number,
                                                        result.elapsed_ms));
        } catch (const std::exception &ex) {
            notify(std::make_unique<ErrorEventMessage>(sender, run_number, start_year, ex.what()));
            throw;
        }
    });

    ElapsedTime elapsed = std::chrono::steady_clock::now() - start;
    notify(std::make_unique<RunnerEventMessage>(runner_id_, RunnerAction::finish, 0u,
                                                elapsed.count()));
    return results;
}

bool Runner::is_running() const noexcept { return running_.load(); }

void Runner::notify(std::unique_ptr<EventMessage> message) {
    if (event_bus_) {
        event_bus_->publish(std::move(message));
    }
}

} // namespace csim
