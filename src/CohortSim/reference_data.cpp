#include "reference_data.h"

#include <algorithm>
#include <fmt/format.h>
#include <stdexcept>

namespace { // anonymous namespace

template <typename Band> void check_bands_disjoint(std::vector<Band> bands, const char *table) {
    std::sort(bands.begin(), bands.end(), [](const Band &left, const Band &right) {
        return left.ages.lower() < right.ages.lower();
    });

    for (std::size_t index = 1; index < bands.size(); index++) {
        if (bands[index].ages.lower() <= bands[index - 1].ages.upper()) {
            throw std::invalid_argument(fmt::format("Overlapping {} age bands: {} and {}", table,
                                                    bands[index - 1].ages.to_string(),
                                                    bands[index].ages.to_string()));
        }
    }
}

} // anonymous namespace

namespace csim {

ReferenceData::ReferenceData(PopulationSnapshot baseline, DoubleAgeGenderTable life_table,
                             std::map<int, double> fertility, std::vector<MigrationBand> migration,
                             std::map<int, double> employment,
                             std::vector<HealthcareBand> healthcare,
                             DemographicConstants demographic, EconomicAssumptions economy)
    : baseline_{std::move(baseline)}, life_table_{std::move(life_table)},
      fertility_{std::move(fertility)}, migration_{std::move(migration)},
      employment_{std::move(employment)}, healthcare_{std::move(healthcare)},
      demographic_{demographic}, economy_{economy} {

    validate_life_table();
    validate_fertility();
    validate_migration();
    validate_employment();
    validate_healthcare();
    validate_constants();
}

void ReferenceData::validate_life_table() const {
    for (auto age = 0; age <= PopulationSnapshot::terminal_age; age++) {
        for (auto gender : {core::Gender::male, core::Gender::female}) {
            if (!life_table_.contains(age, gender)) {
                throw std::invalid_argument(fmt::format("Life table is missing age: {}", age));
            }

            auto qx = life_table_.at(age, gender);
            if (qx < 0.0 || qx > 1.0) {
                throw std::invalid_argument(
                    fmt::format("Life table qx: {} at age: {} is outside [0, 1]", qx, age));
            }
        }
    }
}

void ReferenceData::validate_fertility() const {
    auto total = 0.0;
    for (const auto &[age, rate] : fertility_) {
        if (age < 15 || age > 49) {
            throw std::invalid_argument(
                fmt::format("Fertility rate age: {} is outside the reproductive range", age));
        }

        if (rate < 0.0) {
            throw std::invalid_argument(
                fmt::format("Fertility rate: {} at age: {} must not be negative", rate, age));
        }

        total += rate;
    }

    if (total <= 0.0) {
        throw std::invalid_argument("Fertility table must have a positive total fertility rate.");
    }
}

void ReferenceData::validate_migration() const {
    auto sum = DoubleGenderValue{};
    auto valid_ages = core::IntegerInterval{0, PopulationSnapshot::terminal_age - 1};
    for (const auto &band : migration_) {
        if (!valid_ages.contains(band.ages)) {
            throw std::invalid_argument(fmt::format(
                "Migration age band: {} is outside the range {}", band.ages.to_string(),
                valid_ages.to_string()));
        }

        if (band.weight.males < 0.0 || band.weight.females < 0.0) {
            throw std::invalid_argument(fmt::format(
                "Migration age band: {} has negative weight", band.ages.to_string()));
        }

        sum.males += band.weight.males;
        sum.females += band.weight.females;
    }

    if (sum.males <= 0.0 || sum.females <= 0.0) {
        throw std::invalid_argument("Migration weights must have a positive sum for each gender.");
    }

    check_bands_disjoint(migration_, "migration");
}

void ReferenceData::validate_employment() const {
    for (const auto &[age, rate] : employment_) {
        if (age < 0 || age > PopulationSnapshot::terminal_age) {
            throw std::invalid_argument(
                fmt::format("Employment rate age: {} is outside the population range", age));
        }

        if (rate < 0.0 || rate > 1.0) {
            throw std::invalid_argument(
                fmt::format("Employment rate: {} at age: {} is outside [0, 1]", rate, age));
        }
    }
}

void ReferenceData::validate_healthcare() const {
    auto valid_ages = core::IntegerInterval{0, PopulationSnapshot::terminal_age};
    for (const auto &band : healthcare_) {
        if (!valid_ages.contains(band.ages)) {
            throw std::invalid_argument(fmt::format(
                "Healthcare age band: {} is outside the range {}", band.ages.to_string(),
                valid_ages.to_string()));
        }

        if (band.multiplier < 0.0) {
            throw std::invalid_argument(fmt::format(
                "Healthcare age band: {} has negative multiplier", band.ages.to_string()));
        }
    }

    check_bands_disjoint(healthcare_, "healthcare");
}

void ReferenceData::validate_constants() const {
    if (demographic_.sex_ratio_at_birth <= 0.0) {
        throw std::invalid_argument("Sex ratio at birth must be greater than zero.");
    }

    if (demographic_.migration_male_share < 0.0 || demographic_.migration_male_share > 1.0) {
        throw std::invalid_argument("Migration male share must be in range [0, 1].");
    }

    if (economy_.contribution_rate < 0.0 || economy_.contribution_rate > 1.0) {
        throw std::invalid_argument("Contribution rate must be in range [0, 1].");
    }

    if (economy_.healthcare_public_share < 0.0 || economy_.healthcare_public_share > 1.0) {
        throw std::invalid_argument("Healthcare public share must be in range [0, 1].");
    }

    if (economy_.average_salary < 0.0 || economy_.average_pension < 0.0 ||
        economy_.healthcare_cost_per_capita < 0.0 || economy_.gdp_per_worker < 0.0) {
        throw std::invalid_argument("Economic assumption values must not be negative.");
    }
}

} // namespace csim
