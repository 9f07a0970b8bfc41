#include "csvparser.h"
#include <rapidcsv.h>

#include "CohortSim.Core/interval.h"
#include "CohortSim.Core/scoped_timer.h"
#include "CohortSim.Core/string_util.h"

#include <fmt/color.h>
#include <fmt/format.h>

#include <algorithm>
#include <cstdint>
#include <stdexcept>

#if CSIM_USE_TIMER
#define MEASURE_FUNCTION()                                                                         \
    csim::core::ScopedTimer timer { __func__ }
#else
#define MEASURE_FUNCTION()
#endif

namespace {

namespace cc = csim::core;

rapidcsv::Document open_csv(const std::filesystem::path &file_name) {
    using namespace rapidcsv;
    if (!std::filesystem::exists(file_name)) {
        throw std::runtime_error(fmt::format("File not found: {}", file_name.string()));
    }

    return Document{file_name.string(), LabelParams{}, SeparatorParams{','}};
}

std::vector<std::size_t> column_indices(const rapidcsv::Document &doc,
                                        const std::vector<std::string> &columns,
                                        const std::filesystem::path &file_name) {
    auto headers = doc.GetColumnNames();
    for (auto &header : headers) {
        header = cc::trim(header);
    }

    bool success = true;
    auto result = std::vector<std::size_t>{};
    for (const auto &name : columns) {
        auto index = cc::case_insensitive::index_of(headers, name);
        if (index < 0) {
            success = false;
            fmt::print(fg(fmt::color::dark_salmon), "Column: {} not found in file: {}\n", name,
                       file_name.filename().string());
            continue;
        }

        result.push_back(static_cast<std::size_t>(index));
    }

    if (!success) {
        throw std::runtime_error(
            fmt::format("Required columns not found in file: {}", file_name.string()));
    }

    return result;
}

std::vector<cc::IntegerInterval> parse_age_groups(const std::vector<std::string> &labels,
                                                  int open_upper) {
    auto result = std::vector<cc::IntegerInterval>{};
    result.reserve(labels.size());
    for (const auto &label : labels) {
        result.emplace_back(cc::parse_age_group(label, open_upper));
    }

    return result;
}

std::map<int, double> load_age_rate_table(const std::filesystem::path &file_name,
                                          const std::string &value_column, double scale) {
    auto doc = open_csv(file_name);
    auto index = column_indices(doc, {"age", value_column}, file_name);
    auto ages = doc.GetColumn<int>(index[0]);
    auto rates = doc.GetColumn<double>(index[1]);

    auto result = std::map<int, double>{};
    for (std::size_t row = 0; row < ages.size(); row++) {
        if (!result.emplace(ages[row], rates[row] * scale).second) {
            throw std::runtime_error(fmt::format("Duplicated age: {} in file: {}", ages[row],
                                                 file_name.filename().string()));
        }
    }

    return result;
}

} // anonymous namespace

namespace csim::input {

PopulationSnapshot load_population_from_csv(const std::filesystem::path &file_name) {
    MEASURE_FUNCTION();
    auto doc = open_csv(file_name);
    auto index = column_indices(doc, {"age", "male", "female"}, file_name);
    auto ages = doc.GetColumn<int>(index[0]);
    auto males = doc.GetColumn<std::int64_t>(index[1]);
    auto females = doc.GetColumn<std::int64_t>(index[2]);

    auto cohorts = std::vector<Cohort>{};
    cohorts.reserve(ages.size());
    for (std::size_t row = 0; row < ages.size(); row++) {
        cohorts.emplace_back(
            Cohort{.age = ages[row], .males = males[row], .females = females[row]});
    }

    return PopulationSnapshot{std::move(cohorts)};
}

DoubleAgeGenderTable load_life_table_from_csv(const std::filesystem::path &file_name) {
    MEASURE_FUNCTION();
    auto doc = open_csv(file_name);
    auto index = column_indices(doc, {"age", "male", "female"}, file_name);
    auto ages = doc.GetColumn<int>(index[0]);
    auto males = doc.GetColumn<double>(index[1]);
    auto females = doc.GetColumn<double>(index[2]);
    if (ages.empty()) {
        throw std::runtime_error(fmt::format("Empty life table file: {}", file_name.string()));
    }

    auto [min_age, max_age] = std::minmax_element(ages.cbegin(), ages.cend());
    auto table = create_age_gender_table<double>(core::IntegerInterval{*min_age, *max_age});
    for (std::size_t row = 0; row < ages.size(); row++) {
        table.at(ages[row], core::Gender::male) = males[row];
        table.at(ages[row], core::Gender::female) = females[row];
    }

    if (ages.size() != table.rows()) {
        throw std::runtime_error(
            fmt::format("Life table must have one row per age: {}", file_name.string()));
    }

    return table;
}

std::map<int, double> load_fertility_from_csv(const std::filesystem::path &file_name) {
    MEASURE_FUNCTION();
    constexpr auto per_thousand = 1.0 / 1000.0;
    return load_age_rate_table(file_name, "rate", per_thousand);
}

std::vector<MigrationBand> load_migration_from_csv(const std::filesystem::path &file_name) {
    MEASURE_FUNCTION();
    auto doc = open_csv(file_name);
    auto index = column_indices(doc, {"age_group", "male", "female"}, file_name);
    auto groups = parse_age_groups(doc.GetColumn<std::string>(index[0]),
                                   PopulationSnapshot::terminal_age - 1);
    auto males = doc.GetColumn<double>(index[1]);
    auto females = doc.GetColumn<double>(index[2]);

    auto result = std::vector<MigrationBand>{};
    result.reserve(groups.size());
    for (std::size_t row = 0; row < groups.size(); row++) {
        result.emplace_back(MigrationBand{.ages = groups[row],
                                          .weight = DoubleGenderValue{males[row], females[row]}});
    }

    return result;
}

std::map<int, double> load_employment_from_csv(const std::filesystem::path &file_name) {
    MEASURE_FUNCTION();
    return load_age_rate_table(file_name, "rate", 1.0);
}

std::vector<HealthcareBand> load_healthcare_from_csv(const std::filesystem::path &file_name) {
    MEASURE_FUNCTION();
    auto doc = open_csv(file_name);
    auto index = column_indices(doc, {"age_group", "multiplier"}, file_name);
    auto groups =
        parse_age_groups(doc.GetColumn<std::string>(index[0]), PopulationSnapshot::terminal_age);
    auto multipliers = doc.GetColumn<double>(index[1]);

    auto result = std::vector<HealthcareBand>{};
    result.reserve(groups.size());
    for (std::size_t row = 0; row < groups.size(); row++) {
        result.emplace_back(HealthcareBand{.ages = groups[row], .multiplier = multipliers[row]});
    }

    return result;
}

ReferenceData load_reference_data(const poco::DataInfo &info, const EconomicAssumptions &economy) {
    MEASURE_FUNCTION();
    const auto &folder = info.folder;
    auto constants = DemographicConstants{.sex_ratio_at_birth = info.sex_ratio_at_birth,
                                          .migration_male_share = info.migration_male_share};

    return ReferenceData{load_population_from_csv(folder / info.population),
                         load_life_table_from_csv(folder / info.life_table),
                         load_fertility_from_csv(folder / info.fertility),
                         load_migration_from_csv(folder / info.migration),
                         load_employment_from_csv(folder / info.employment),
                         load_healthcare_from_csv(folder / info.healthcare),
                         constants,
                         economy};
}

} // namespace csim::input
