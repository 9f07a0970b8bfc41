#include "jsonparser.h"

namespace csim::input::poco {

// Reference data files
void to_json(json &j, const DataInfo &p) {
    j = json{{"folder", p.folder.string()},
             {"files",
              {{"population", p.population},
               {"life_table", p.life_table},
               {"fertility", p.fertility},
               {"migration", p.migration},
               {"employment", p.employment},
               {"healthcare", p.healthcare}}},
             {"sex_ratio_at_birth", p.sex_ratio_at_birth},
             {"migration_male_share", p.migration_male_share}};
}

void from_json(const json &j, DataInfo &p) {
    p.folder = j.at("folder").get<std::string>();
    const auto &files = j.at("files");
    files.at("population").get_to(p.population);
    files.at("life_table").get_to(p.life_table);
    files.at("fertility").get_to(p.fertility);
    files.at("migration").get_to(p.migration);
    files.at("employment").get_to(p.employment);
    files.at("healthcare").get_to(p.healthcare);
    j.at("sex_ratio_at_birth").get_to(p.sex_ratio_at_birth);
    j.at("migration_male_share").get_to(p.migration_male_share);
}

// Output information
void to_json(json &j, const OutputInfo &p) {
    j = json{{"folder", p.folder}, {"file_name", p.file_name}};
}

void from_json(const json &j, OutputInfo &p) {
    j.at("folder").get_to(p.folder);
    j.at("file_name").get_to(p.file_name);
}

} // namespace csim::input::poco

namespace csim {
using json = nlohmann::json;

void to_json(json &j, const EconomicAssumptions &p) {
    j = json{{"average_salary", p.average_salary},
             {"contribution_rate", p.contribution_rate},
             {"average_pension", p.average_pension},
             {"healthcare_cost_per_capita", p.healthcare_cost_per_capita},
             {"healthcare_public_share", p.healthcare_public_share},
             {"gdp_per_worker", p.gdp_per_worker},
             {"wage_growth", p.wage_growth},
             {"pension_growth", p.pension_growth},
             {"healthcare_growth", p.healthcare_growth}};
}

void from_json(const json &j, EconomicAssumptions &p) {
    j.at("average_salary").get_to(p.average_salary);
    j.at("contribution_rate").get_to(p.contribution_rate);
    j.at("average_pension").get_to(p.average_pension);
    j.at("healthcare_cost_per_capita").get_to(p.healthcare_cost_per_capita);
    j.at("healthcare_public_share").get_to(p.healthcare_public_share);
    j.at("gdp_per_worker").get_to(p.gdp_per_worker);
    j.at("wage_growth").get_to(p.wage_growth);
    j.at("pension_growth").get_to(p.pension_growth);
    j.at("healthcare_growth").get_to(p.healthcare_growth);
}

void to_json(json &j, const MortalityImprovement &p) {
    j = json{{"male", p.male}, {"female", p.female}};
}

void from_json(const json &j, MortalityImprovement &p) {
    j.at("male").get_to(p.male);
    j.at("female").get_to(p.female);
}

void to_json(json &j, const ScenarioPreset &p) {
    j = json{{"fertility_rate", p.fertility_rate},
             {"net_migration", p.net_migration},
             {"mortality_improvement", p.mortality_improvement},
             {"entry_age_shift", p.entry_age_shift},
             {"unemployment_adjustment", p.unemployment_adjustment}};
}

void from_json(const json &j, ScenarioPreset &p) {
    j.at("fertility_rate").get_to(p.fertility_rate);
    j.at("net_migration").get_to(p.net_migration);
    j.at("mortality_improvement").get_to(p.mortality_improvement);
    p.entry_age_shift = j.value("entry_age_shift", 0);
    p.unemployment_adjustment = j.value("unemployment_adjustment", 0.0);
}

void to_json(json &j, const SimulationParameters &p) {
    j = json{{"retirement_age", p.retirement_age},
             {"fertility_rate", p.fertility_rate},
             {"net_migration", p.net_migration},
             {"mortality_improvement", p.mortality_improvement},
             {"entry_age_shift", p.entry_age_shift},
             {"unemployment_adjustment", p.unemployment_adjustment}};
}

} // namespace csim
