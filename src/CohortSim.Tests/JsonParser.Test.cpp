#include "CohortSim.Input/jsonparser.h"

#include "pch.h"

using namespace csim;
using namespace csim::input::poco;
using json = nlohmann::json;

TEST(JsonParser, DataInfoFromJson) {
    const auto j = json::parse(R"(
        {
            "folder": "data",
            "files": {
                "population": "population.csv",
                "life_table": "life_table.csv",
                "fertility": "fertility.csv",
                "migration": "migration.csv",
                "employment": "employment.csv",
                "healthcare": "healthcare.csv"
            },
            "sex_ratio_at_birth": 1.05,
            "migration_male_share": 0.48
        })");

    auto info = j.get<DataInfo>();
    EXPECT_EQ(info.folder, std::filesystem::path{"data"});
    EXPECT_EQ(info.population, "population.csv");
    EXPECT_EQ(info.life_table, "life_table.csv");
    EXPECT_EQ(info.migration, "migration.csv");
    EXPECT_DOUBLE_EQ(info.sex_ratio_at_birth, 1.05);

    // Convert to JSON and back again
    const json other = info;
    EXPECT_EQ(other.get<DataInfo>(), info);
}

TEST(JsonParser, DataInfoMissingFile) {
    auto j = json{};
    j["folder"] = "data";
    j["files"]["population"] = "population.csv";
    j["sex_ratio_at_birth"] = 1.05;
    j["migration_male_share"] = 0.48;
    EXPECT_THROW(j.get<DataInfo>(), json::out_of_range);
}

TEST(JsonParser, ScenarioPresetOptionalFields) {
    const auto j = json::parse(R"(
        {
            "fertility_rate": 1.2,
            "net_migration": -25000,
            "mortality_improvement": { "male": 0.005, "female": 0.004 }
        })");

    auto preset = j.get<ScenarioPreset>();
    EXPECT_DOUBLE_EQ(preset.fertility_rate, 1.2);
    EXPECT_EQ(preset.net_migration, -25000);
    EXPECT_DOUBLE_EQ(preset.mortality_improvement.male, 0.005);
    EXPECT_DOUBLE_EQ(preset.mortality_improvement.female, 0.004);
    EXPECT_EQ(preset.entry_age_shift, 0);
    EXPECT_DOUBLE_EQ(preset.unemployment_adjustment, 0.0);

    auto with_labour = j;
    with_labour["entry_age_shift"] = 2;
    with_labour["unemployment_adjustment"] = 0.05;
    preset = with_labour.get<ScenarioPreset>();
    EXPECT_EQ(preset.entry_age_shift, 2);
    EXPECT_DOUBLE_EQ(preset.unemployment_adjustment, 0.05);
}

TEST(JsonParser, ScenarioPresetWrongType) {
    auto j = json::parse(R"(
        {
            "fertility_rate": "high",
            "net_migration": 110000,
            "mortality_improvement": { "male": 0.01, "female": 0.008 }
        })");

    EXPECT_THROW(j.get<ScenarioPreset>(), json::type_error);
}

TEST(JsonParser, SimulationParametersToJson) {
    auto parameters = SimulationParameters{};
    parameters.retirement_age = 67;
    parameters.entry_age_shift = 1;

    const json j = parameters;
    EXPECT_EQ(j.at("retirement_age").get<int>(), 67);
    EXPECT_DOUBLE_EQ(j.at("fertility_rate").get<double>(), 1.40);
    EXPECT_EQ(j.at("net_migration").get<int>(), 110000);
    EXPECT_DOUBLE_EQ(j.at("mortality_improvement").at("male").get<double>(), 0.010);
    EXPECT_DOUBLE_EQ(j.at("mortality_improvement").at("female").get<double>(), 0.008);
    EXPECT_EQ(j.at("entry_age_shift").get<int>(), 1);
    EXPECT_DOUBLE_EQ(j.at("unemployment_adjustment").get<double>(), 0.0);
}
