#include "cohort_evolution.h"

#include <cmath>
#include <cstdint>

namespace { // anonymous namespace

struct SurvivalOutcome {
    std::int64_t survivors{};
    std::int64_t deaths{};
    std::int64_t migration{};
};

/// @brief Applies migration then mortality to a single cohort count
SurvivalOutcome survive(std::int64_t population, std::int64_t migrants, double death_probability) {
    auto outcome = SurvivalOutcome{};
    outcome.migration = migrants;
    if (population + migrants < 0) {
        outcome.migration = -population;
    }

    auto exposed = population + outcome.migration;
    outcome.deaths =
        static_cast<std::int64_t>(std::llround(static_cast<double>(exposed) * death_probability));
    outcome.survivors = exposed - outcome.deaths;
    return outcome;
}

} // anonymous namespace

namespace csim {

CohortEvolution::CohortEvolution(const DemographicRates &rates) : rates_{rates} {}

EvolutionResult CohortEvolution::evolve(const PopulationSnapshot &current, int years_elapsed,
                                        const SimulationParameters &parameters) const {
    constexpr auto terminal_age = PopulationSnapshot::terminal_age;
    const auto &improvement = parameters.mortality_improvement;

    auto births = calculate_births(current, parameters);
    auto migration_total = split_migration(parameters.net_migration);
    auto male_migrants = distribute_migration(migration_total.males, core::Gender::male);
    auto female_migrants = distribute_migration(migration_total.females, core::Gender::female);

    auto deaths = IntegerGenderValue{};
    auto applied_migration = IntegerGenderValue{};
    auto cohorts = std::vector<Cohort>{};
    cohorts.reserve(PopulationSnapshot::cohort_count);
    cohorts.emplace_back(Cohort{.age = 0, .males = births.males, .females = births.females});

    for (auto age = 0; age < terminal_age; age++) {
        const auto &cohort = current.at(age);
        auto index = static_cast<std::size_t>(age);
        auto male = survive(
            cohort.males, male_migrants[index],
            rates_.mortality_probability(age, core::Gender::male, years_elapsed, improvement));
        auto female = survive(
            cohort.females, female_migrants[index],
            rates_.mortality_probability(age, core::Gender::female, years_elapsed, improvement));

        deaths.males += male.deaths;
        deaths.females += female.deaths;
        applied_migration.males += male.migration;
        applied_migration.females += female.migration;
        cohorts.emplace_back(
            Cohort{.age = age + 1, .males = male.survivors, .females = female.survivors});
    }

    // Terminal group: no migration, table mortality, fresh state.
    const auto &terminal = current.at(terminal_age);
    auto male = survive(terminal.males, 0,
                        rates_.mortality_probability(terminal_age, core::Gender::male,
                                                     years_elapsed, improvement));
    auto female = survive(terminal.females, 0,
                          rates_.mortality_probability(terminal_age, core::Gender::female,
                                                       years_elapsed, improvement));
    deaths.males += male.deaths;
    deaths.females += female.deaths;
    cohorts.back().males += male.survivors;
    cohorts.back().females += female.survivors;

    return EvolutionResult{.population = PopulationSnapshot{std::move(cohorts)},
                           .births = births,
                           .deaths = deaths,
                           .migration = applied_migration};
}

std::vector<std::int64_t> CohortEvolution::distribute_migration(std::int64_t total,
                                                                core::Gender gender) const {
    constexpr auto terminal_age = PopulationSnapshot::terminal_age;
    auto migrants = std::vector<std::int64_t>(static_cast<std::size_t>(terminal_age), 0);
    if (total == 0) {
        return migrants;
    }

    auto carry = 0.0;
    for (auto age = 0; age < terminal_age; age++) {
        auto exact = static_cast<double>(total) * rates_.migration_weight(age, gender) + carry;
        auto whole = std::floor(exact);
        migrants[static_cast<std::size_t>(age)] = static_cast<std::int64_t>(whole);
        carry = exact - whole;
    }

    migrants.back() += static_cast<std::int64_t>(std::llround(carry));
    return migrants;
}

IntegerGenderValue CohortEvolution::calculate_births(const PopulationSnapshot &current,
                                                     const SimulationParameters &parameters) const {
    auto scale = parameters.fertility_rate / rates_.baseline_tfr();
    auto expected = 0.0;
    for (auto age = 15; age <= 49; age++) {
        auto females = static_cast<double>(current.at(age).females);
        expected += females * rates_.fertility_rate(age) * scale;
    }

    auto total = static_cast<std::int64_t>(std::llround(expected));
    auto ratio = rates_.reference().demographic().sex_ratio_at_birth;
    auto males =
        static_cast<std::int64_t>(std::floor(static_cast<double>(total) * ratio / (1.0 + ratio)));
    return IntegerGenderValue{males, total - males};
}

IntegerGenderValue CohortEvolution::split_migration(int net_migration) const noexcept {
    auto share = rates_.reference().demographic().migration_male_share;
    auto males = static_cast<std::int64_t>(std::llround(net_migration * share));
    return IntegerGenderValue{males, net_migration - males};
}

} // namespace csim
