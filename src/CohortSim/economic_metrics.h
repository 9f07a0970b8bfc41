#pragma once

#include "demographic_rates.h"
#include "population_snapshot.h"

#include <string>

namespace csim {

/// @brief Economic indicators derived from one year population
struct EconomicMetrics {
    /// @brief Employment rate weighted population aged 15 and over
    double actual_workforce{};

    /// @brief Retirement age population not in employment
    double actual_pensioners{};

    /// @brief Population aged from 15 up to the retirement age, exclusive
    std::int64_t working_age_population{};

    /// @brief Workforce per working age person
    /// @note Post-retirement workers count in the workforce only, the rate can exceed one.
    double labour_utilisation_rate{};

    double contributions{};
    double pension_payments{};

    /// @brief Contributions minus pension payments
    double social_security_balance{};

    /// @brief The absolute negative balance, zero for a surplus
    double social_security_deficit{};

    double balance_per_worker{};
    double healthcare_cost{};
    double public_healthcare_cost{};
    double healthcare_cost_per_worker{};

    /// @brief Deficit plus public healthcare cost per worker
    double burden_per_worker{};

    /// @brief Workforce output at the inflated productivity
    double gdp_proxy{};

    /// @brief Fiscal sustainability score in range [0, 100]
    double sustainability_index{};
};

/// @brief Enumerates the sustainability index bands
enum class SustainabilityLevel : uint8_t {
    /// @brief Index below 30
    critical,

    /// @brief Index below 60
    warning,

    /// @brief Index of 60 and above
    healthy
};

/// @brief Defines the economic metrics calculator
class EconomicCalculator {
  public:
    /// @brief The fraction of GDP at which the fiscal burden is unsustainable
    static constexpr double fiscal_threshold = 0.40;

    EconomicCalculator() = delete;

    /// @brief Initialises a new instance of the EconomicCalculator class
    /// @param rates The demographic rate functions, must outlive this instance
    explicit EconomicCalculator(const DemographicRates &rates);

    /// @brief Calculates the economic metrics of a population
    /// @param population The population snapshot
    /// @param retirement_age The working to retired boundary age
    /// @param years_elapsed The number of years from the projection start
    /// @param entry_age_shift The workforce entry age shift
    /// @param unemployment_adjustment The unemployment adjustment
    /// @return The economic metrics
    EconomicMetrics calculate(const PopulationSnapshot &population, int retirement_age,
                              int years_elapsed, int entry_age_shift,
                              double unemployment_adjustment) const;

  private:
    const DemographicRates &rates_;
};

/// @brief Classifies a sustainability index value
/// @param index The sustainability index
/// @return The sustainability band
SustainabilityLevel classify_sustainability(double index) noexcept;

/// @brief Converts a SustainabilityLevel to its string representation
/// @param level The sustainability band
/// @return The band name
std::string to_string(SustainabilityLevel level);

} // namespace csim
