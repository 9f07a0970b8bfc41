#pragma once

#include "cohort_evolution.h"

#include <cstdint>

namespace csim {

/// @brief The population conservation check of one projection step
struct BalanceCheck {
    /// @brief The year the population evolved from
    int year{};

    std::int64_t previous_total{};
    std::int64_t births{};
    std::int64_t deaths{};
    std::int64_t migration{};

    /// @brief Previous total plus births minus deaths plus migration
    std::int64_t expected_total{};

    /// @brief The evolved population total
    std::int64_t actual_total{};

    /// @brief Absolute difference between the expected and actual totals
    double discrepancy{};

    /// @brief Whether the discrepancy is within the validator tolerance
    bool passed{};
};

/// @brief Cross-checks each projection step for population conservation
class BalanceValidator {
  public:
    /// @brief Initialises a new instance of the BalanceValidator class
    /// @param tolerance The absolute discrepancy tolerance, in persons
    /// @throws std::invalid_argument for negative tolerance
    explicit BalanceValidator(double tolerance = 1.0);

    /// @brief Gets the absolute discrepancy tolerance
    double tolerance() const noexcept { return tolerance_; }

    /// @brief Checks a projection step for population conservation
    /// @param year The year the population evolved from
    /// @param previous The population before the step
    /// @param result The evolution step result
    /// @return The conservation check outcome
    BalanceCheck check(int year, const PopulationSnapshot &previous,
                       const EvolutionResult &result) const noexcept;

  private:
    double tolerance_;
};

} // namespace csim
