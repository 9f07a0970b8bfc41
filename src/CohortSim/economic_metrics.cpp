#include "economic_metrics.h"

#include <algorithm>
#include <cmath>

namespace csim {

EconomicCalculator::EconomicCalculator(const DemographicRates &rates) : rates_{rates} {}

EconomicMetrics EconomicCalculator::calculate(const PopulationSnapshot &population,
                                              int retirement_age, int years_elapsed,
                                              int entry_age_shift,
                                              double unemployment_adjustment) const {
    const auto &economy = rates_.reference().economy();
    auto wage_factor = std::pow(1.0 + economy.wage_growth, years_elapsed);
    auto pension_factor = std::pow(1.0 + economy.pension_growth, years_elapsed);
    auto healthcare_factor = std::pow(1.0 + economy.healthcare_growth, years_elapsed);

    auto result = EconomicMetrics{};
    for (const auto &cohort : population) {
        auto total = static_cast<double>(cohort.total());
        if (cohort.age >= 15) {
            auto employment =
                rates_.employment_rate(cohort.age, entry_age_shift, unemployment_adjustment);
            result.actual_workforce += total * employment;
            if (cohort.age >= retirement_age) {
                result.actual_pensioners += total * (1.0 - employment);
            } else {
                result.working_age_population += cohort.total();
            }
        }

        result.healthcare_cost += total * economy.healthcare_cost_per_capita *
                                  rates_.healthcare_multiplier(cohort.age) * healthcare_factor;
    }

    result.contributions =
        result.actual_workforce * economy.average_salary * wage_factor * economy.contribution_rate;
    result.pension_payments = result.actual_pensioners * economy.average_pension * pension_factor;
    result.social_security_balance = result.contributions - result.pension_payments;
    result.social_security_deficit = std::max(0.0, -result.social_security_balance);
    result.public_healthcare_cost = result.healthcare_cost * economy.healthcare_public_share;
    result.gdp_proxy = result.actual_workforce * economy.gdp_per_worker * wage_factor;

    if (result.working_age_population > 0) {
        result.labour_utilisation_rate =
            result.actual_workforce / static_cast<double>(result.working_age_population);
    }

    if (result.actual_workforce > 0.0) {
        result.balance_per_worker = result.social_security_balance / result.actual_workforce;
        result.healthcare_cost_per_worker = result.healthcare_cost / result.actual_workforce;
        result.burden_per_worker =
            (result.social_security_deficit + result.public_healthcare_cost) /
            result.actual_workforce;
    }

    if (result.gdp_proxy > 0.0) {
        auto burden = result.social_security_deficit + result.public_healthcare_cost;
        auto index = 100.0 * (1.0 - burden / (result.gdp_proxy * fiscal_threshold));
        result.sustainability_index = std::clamp(index, 0.0, 100.0);
    }

    return result;
}

SustainabilityLevel classify_sustainability(double index) noexcept {
    if (index < 30.0) {
        return SustainabilityLevel::critical;
    }

    if (index < 60.0) {
        return SustainabilityLevel::warning;
    }

    return SustainabilityLevel::healthy;
}

std::string to_string(SustainabilityLevel level) {
    switch (level) {
    case SustainabilityLevel::critical:
        return "critical";
    case SustainabilityLevel::warning:
        return "warning";
    case SustainabilityLevel::healthy:
        return "healthy";
    default:
        return "unknown";
    }
}

} // namespace csim
