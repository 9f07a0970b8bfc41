#include "balance_validator.h"

#include <cstdlib>
#include <stdexcept>

namespace csim {

BalanceValidator::BalanceValidator(double tolerance) : tolerance_{tolerance} {
    if (tolerance_ < 0.0) {
        throw std::invalid_argument("Balance tolerance must not be negative.");
    }
}

BalanceCheck BalanceValidator::check(int year, const PopulationSnapshot &previous,
                                     const EvolutionResult &result) const noexcept {
    auto outcome = BalanceCheck{.year = year,
                                .previous_total = previous.total(),
                                .births = result.births.total(),
                                .deaths = result.deaths.total(),
                                .migration = result.migration.total()};

    outcome.expected_total =
        outcome.previous_total + outcome.births - outcome.deaths + outcome.migration;
    outcome.actual_total = result.population.total();
    outcome.discrepancy =
        static_cast<double>(std::llabs(outcome.actual_total - outcome.expected_total));
    outcome.passed = outcome.discrepancy <= tolerance_;
    return outcome;
}

} // namespace csim
