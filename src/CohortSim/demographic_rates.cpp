#include "demographic_rates.h"

#include <algorithm>
#include <cmath>

namespace csim {

DemographicRates::DemographicRates(const ReferenceData &reference) : reference_{reference} {
    for (const auto &band : reference_.migration()) {
        migration_weight_sum_.males += band.weight.males;
        migration_weight_sum_.females += band.weight.females;
    }

    for (const auto &[age, rate] : reference_.fertility()) {
        baseline_tfr_ += rate;
    }
}

double DemographicRates::mortality_probability(int age, core::Gender gender, int years_elapsed,
                                               const MortalityImprovement &improvement) const {
    if (age < 0 || gender == core::Gender::unknown) {
        return 0.0;
    }

    auto table_age = std::min(age, PopulationSnapshot::terminal_age);
    auto base_qx = reference_.life_table().at(table_age, gender);
    if (table_age == PopulationSnapshot::terminal_age) {
        return std::clamp(base_qx, 0.0, 1.0);
    }

    auto improved_qx = base_qx * std::pow(1.0 - improvement.rate(gender), years_elapsed);
    return std::clamp(improved_qx, 0.0, 1.0);
}

double DemographicRates::fertility_rate(int age) const noexcept {
    if (age < 15 || age > 49) {
        return 0.0;
    }

    auto it = reference_.fertility().find(age);
    if (it != reference_.fertility().end()) {
        return it->second;
    }

    return 0.0;
}

double DemographicRates::migration_weight(int age, core::Gender gender) const noexcept {
    auto weight_sum = migration_weight_sum_.at(gender);
    if (weight_sum <= 0.0) {
        return 0.0;
    }

    for (const auto &band : reference_.migration()) {
        if (band.ages.contains(age)) {
            auto band_width = static_cast<double>(band.ages.length() + 1);
            return band.weight.at(gender) / weight_sum / band_width;
        }
    }

    return 0.0;
}

double DemographicRates::employment_rate(int age, int entry_age_shift,
                                         double unemployment_adjustment) const noexcept {
    if (age < 15) {
        return 0.0;
    }

    auto effective_age = std::max(15, age - entry_age_shift);
    auto it = reference_.employment().find(effective_age);
    if (it == reference_.employment().end()) {
        return 0.0;
    }

    return std::clamp(it->second * (1.0 - unemployment_adjustment), 0.0, 1.0);
}

double DemographicRates::healthcare_multiplier(int age) const noexcept {
    for (const auto &band : reference_.healthcare()) {
        if (band.ages.contains(age)) {
            return band.multiplier;
        }
    }

    return 0.0;
}

} // namespace csim
