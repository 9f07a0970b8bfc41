#include "projection.h"
#include "balance_message.h"
#include "info_message.h"

#include <chrono>
#include <fmt/format.h>

namespace csim {

using ElapsedTime = std::chrono::duration<double, std::milli>;

ProjectionDriver::ProjectionDriver(const ReferenceData &reference,
                                   std::shared_ptr<EventAggregator> bus,
                                   BalanceValidator validator, std::string name)
    : reference_{reference}, rates_{reference}, evolution_{rates_}, calculator_{rates_},
      validator_{validator}, event_bus_{std::move(bus)}, name_{std::move(name)} {}

std::vector<YearRecord> ProjectionDriver::run(int start_year, int end_year,
                                              const SimulationParameters &parameters,
                                              unsigned int run_number) {
    state_ = ProjectionState::validating;
    balance_failures_.clear();
    validate_parameters(parameters, start_year, end_year);

    state_ = ProjectionState::running;
    auto start = std::chrono::steady_clock::now();
    notify(std::make_unique<InfoEventMessage>(
        name_, ModelAction::start, run_number, start_year,
        fmt::format("population size: {}", reference_.baseline().total())));

    auto records = std::vector<YearRecord>{};
    records.reserve(static_cast<std::size_t>(end_year - start_year) + 1);
    auto current = reference_.baseline();
    for (auto year = start_year; year <= end_year; year++) {
        auto years_elapsed = year - start_year;
        auto summary = summarize(current, parameters.retirement_age);
        auto economics =
            calculator_.calculate(current, parameters.retirement_age, years_elapsed,
                                  parameters.entry_age_shift, parameters.unemployment_adjustment);
        records.emplace_back(YearRecord{
            .year = year, .population = current, .summary = summary, .economics = economics});

        if (year == end_year) {
            break;
        }

        auto result = evolution_.evolve(current, years_elapsed, parameters);
        auto check = validator_.check(year, current, result);
        if (!check.passed) {
            balance_failures_.push_back(check);
            notify(std::make_unique<BalanceEventMessage>(name_, run_number, check));
        }

        current = std::move(result.population);
        notify(std::make_unique<InfoEventMessage>(
            name_, ModelAction::update, run_number, year + 1,
            fmt::format("population size: {}", current.total())));
    }

    state_ = ProjectionState::complete;
    ElapsedTime elapsed = std::chrono::steady_clock::now() - start;
    notify(std::make_unique<InfoEventMessage>(name_, ModelAction::stop, run_number, end_year,
                                              fmt::format("elapsed: {}ms", elapsed.count())));
    return records;
}

void ProjectionDriver::notify(std::unique_ptr<EventMessage> message) const {
    if (event_bus_) {
        event_bus_->publish(std::move(message));
    }
}

std::vector<YearRecord> project(const ReferenceData &reference, int start_year, int end_year,
                                const SimulationParameters &parameters) {
    auto driver = ProjectionDriver{reference};
    return driver.run(start_year, end_year, parameters);
}

} // namespace csim
