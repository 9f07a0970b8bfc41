#pragma once

#include "reference_data.h"
#include "simulation_parameters.h"

namespace csim {

/// @brief Defines the demographic and labour rate lookup functions
///
/// All functions are pure lookups over the injected reference data. Ages outside a table's
/// covered range resolve to zero rather than failing.
class DemographicRates {
  public:
    DemographicRates() = delete;

    /// @brief Initialises a new instance of the DemographicRates class
    /// @param reference The reference data tables, must outlive this instance
    explicit DemographicRates(const ReferenceData &reference);

    /// @brief Gets the annual death probability with mortality improvement applied
    ///
    /// The base qx for `min(age, 100)` is reduced by `(1 - rate)^years_elapsed`, the
    /// terminal age keeps its table value to prevent an immortal open-ended group.
    ///
    /// @param age The age in years
    /// @param gender The gender
    /// @param years_elapsed The number of years from the projection start
    /// @param improvement The mortality improvement rates
    /// @return The death probability in range [0, 1]
    double mortality_probability(int age, core::Gender gender, int years_elapsed,
                                 const MortalityImprovement &improvement) const;

    /// @brief Gets the age-specific fertility rate, births per woman per year
    /// @param age The mother's age
    /// @return The table rate for ages 15 to 49, otherwise zero
    double fertility_rate(int age) const noexcept;

    /// @brief Gets the reference total fertility rate, sum of the fertility table
    double baseline_tfr() const noexcept { return baseline_tfr_; }

    /// @brief Gets the normalised share of net migration allocated to a single age
    /// @param age The age in years
    /// @param gender The gender
    /// @return The age share, the shares of all ages sum to one for each gender
    double migration_weight(int age, core::Gender gender) const noexcept;

    /// @brief Gets the employment rate adjusted for workforce entry and unemployment
    /// @param age The age in years
    /// @param entry_age_shift Years to shift the base rates to the right
    /// @param unemployment_adjustment Proportional reduction of the base rate
    /// @return The employment rate in range [0, 1], zero below age 15
    double employment_rate(int age, int entry_age_shift,
                           double unemployment_adjustment) const noexcept;

    /// @brief Gets the healthcare cost multiplier relative to the adult baseline
    /// @param age The age in years
    /// @return The age band multiplier, zero for ages without a band
    double healthcare_multiplier(int age) const noexcept;

    /// @brief Gets the reference data tables
    const ReferenceData &reference() const noexcept { return reference_; }

  private:
    const ReferenceData &reference_;
    DoubleGenderValue migration_weight_sum_{};
    double baseline_tfr_{};
};

} // namespace csim
