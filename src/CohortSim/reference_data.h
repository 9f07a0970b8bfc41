#pragma once

#include "CohortSim.Core/interval.h"
#include "gender_table.h"
#include "gender_value.h"
#include "population_snapshot.h"

#include <map>
#include <vector>

namespace csim {

/// @brief Migration distribution weight for an age band
struct MigrationBand {
    /// @brief The age band, inclusive
    core::IntegerInterval ages;

    /// @brief The relative weights by gender, not required to sum to one
    DoubleGenderValue weight;
};

/// @brief Healthcare cost multiplier for an age band, relative to the adult baseline
struct HealthcareBand {
    /// @brief The age band, inclusive
    core::IntegerInterval ages;

    /// @brief The cost multiplier
    double multiplier{};
};

/// @brief Fixed demographic constants
struct DemographicConstants {
    /// @brief Males born per female
    double sex_ratio_at_birth{1.05};

    /// @brief Male proportion of the total net migration
    double migration_male_share{0.48};
};

/// @brief Economic assumptions at the base year, in currency units per year
struct EconomicAssumptions {
    double average_salary{};
    double contribution_rate{};
    double average_pension{};
    double healthcare_cost_per_capita{};
    double healthcare_public_share{};
    double gdp_per_worker{};

    /// @brief Annual nominal wage growth rate
    double wage_growth{};

    /// @brief Annual pension indexation rate
    double pension_growth{};

    /// @brief Annual healthcare cost inflation rate
    double healthcare_growth{};
};

/// @brief Read-only reference tables consumed by the projection engine
///
/// All tables are validated once at construction, instances are immutable afterwards and
/// can be safely shared by concurrent projection runs.
class ReferenceData {
  public:
    ReferenceData() = delete;

    /// @brief Initialises a new instance of the ReferenceData class
    /// @param baseline The base year population
    /// @param life_table Annual death probability (qx) by age and gender, ages 0 to 100
    /// @param fertility Age-specific fertility rate, births per woman per year
    /// @param migration Migration weights by age band, terminal age excluded
    /// @param employment Employment rate by age
    /// @param healthcare Healthcare cost multiplier by age band
    /// @param demographic The demographic constants
    /// @param economy The economic assumptions
    /// @throws std::invalid_argument for incomplete or out-of-range reference values
    ReferenceData(PopulationSnapshot baseline, DoubleAgeGenderTable life_table,
                  std::map<int, double> fertility, std::vector<MigrationBand> migration,
                  std::map<int, double> employment, std::vector<HealthcareBand> healthcare,
                  DemographicConstants demographic, EconomicAssumptions economy);

    const PopulationSnapshot &baseline() const noexcept { return baseline_; }

    const DoubleAgeGenderTable &life_table() const noexcept { return life_table_; }

    const std::map<int, double> &fertility() const noexcept { return fertility_; }

    const std::vector<MigrationBand> &migration() const noexcept { return migration_; }

    const std::map<int, double> &employment() const noexcept { return employment_; }

    const std::vector<HealthcareBand> &healthcare() const noexcept { return healthcare_; }

    const DemographicConstants &demographic() const noexcept { return demographic_; }

    const EconomicAssumptions &economy() const noexcept { return economy_; }

  private:
    PopulationSnapshot baseline_;
    DoubleAgeGenderTable life_table_;
    std::map<int, double> fertility_;
    std::vector<MigrationBand> migration_;
    std::map<int, double> employment_;
    std::vector<HealthcareBand> healthcare_;
    DemographicConstants demographic_;
    EconomicAssumptions economy_;

    void validate_life_table() const;
    void validate_fertility() const;
    void validate_migration() const;
    void validate_employment() const;
    void validate_healthcare() const;
    void validate_constants() const;
};

} // namespace csim
