#include "data_config.h"
#include "pch.h"

#include "CohortSim.Input/csvparser.h"
#include "CohortSim/projection.h"

#include <filesystem>
#include <fstream>

using namespace csim;
using namespace csim::input;

namespace {

poco::DataInfo create_data_info() {
    return poco::DataInfo{.folder = default_datastore_path(),
                          .population = "population.csv",
                          .life_table = "life_table.csv",
                          .fertility = "fertility.csv",
                          .migration = "migration.csv",
                          .employment = "employment.csv",
                          .healthcare = "healthcare.csv",
                          .sex_ratio_at_birth = 1.05,
                          .migration_male_share = 0.48};
}

EconomicAssumptions create_economy() {
    return EconomicAssumptions{.average_salary = 20580.0,
                               .contribution_rate = 0.3475,
                               .average_pension = 7820.0,
                               .healthcare_cost_per_capita = 2310.0,
                               .healthcare_public_share = 0.63,
                               .gdp_per_worker = 55400.0,
                               .wage_growth = 0.01,
                               .pension_growth = 0.01,
                               .healthcare_growth = 0.015};
}

std::filesystem::path write_temp_file(const std::string &name, const std::string &content) {
    auto file_name = std::filesystem::path{::testing::TempDir()} / name;
    std::ofstream ofs{file_name, std::ios::trunc};
    ofs << content;
    return file_name;
}

} // anonymous namespace

class DatastoreTest : public ::testing::Test {
  protected:
    DatastoreTest() : info{create_data_info()} {}

    std::filesystem::path file(const std::string &name) const { return info.folder / name; }

    poco::DataInfo info;
};

TEST_F(DatastoreTest, LoadBaselinePopulation) {
    auto population = load_population_from_csv(file(info.population));
    ASSERT_EQ(population.size(), PopulationSnapshot::cohort_count);
    EXPECT_EQ(population.total(), 10749635);
    EXPECT_GT(population.total_females(), population.total_males());
    EXPECT_EQ(population.at(0).age, 0);
    EXPECT_EQ(population.at(PopulationSnapshot::terminal_age).age,
              PopulationSnapshot::terminal_age);
}

TEST_F(DatastoreTest, LoadLifeTable) {
    auto table = load_life_table_from_csv(file(info.life_table));
    EXPECT_EQ(table.rows(), PopulationSnapshot::cohort_count);
    EXPECT_DOUBLE_EQ(table.at(100, core::Gender::male), 1.0);
    EXPECT_DOUBLE_EQ(table.at(100, core::Gender::female), 1.0);
    EXPECT_GT(table.at(80, core::Gender::male), table.at(80, core::Gender::female));
    EXPECT_GT(table.at(80, core::Gender::male), table.at(40, core::Gender::male));
}

TEST_F(DatastoreTest, LoadFertilityPerWoman) {
    auto fertility = load_fertility_from_csv(file(info.fertility));
    ASSERT_EQ(fertility.size(), 35);
    EXPECT_EQ(fertility.begin()->first, 15);
    EXPECT_EQ(fertility.rbegin()->first, 49);
    EXPECT_NEAR(fertility.at(32), 0.0755, 1e-12);
    EXPECT_NEAR(fertility.at(15), 0.0018, 1e-12);
}

TEST_F(DatastoreTest, LoadMigrationBands) {
    auto migration = load_migration_from_csv(file(info.migration));
    ASSERT_EQ(migration.size(), 17);
    EXPECT_EQ(migration.front().ages, core::IntegerInterval(0, 4));
    EXPECT_NEAR(migration.front().weight.males, 0.025, 1e-12);
    EXPECT_NEAR(migration.front().weight.females, 0.023, 1e-12);

    // Open-ended band stops before the terminal age
    EXPECT_EQ(migration.back().ages, core::IntegerInterval(80, 99));
}

TEST_F(DatastoreTest, LoadEmploymentRates) {
    auto employment = load_employment_from_csv(file(info.employment));
    ASSERT_EQ(employment.size(), PopulationSnapshot::cohort_count);
    EXPECT_DOUBLE_EQ(employment.at(10), 0.0);
    EXPECT_DOUBLE_EQ(employment.at(40), 0.84);
    EXPECT_DOUBLE_EQ(employment.at(90), 0.0);
}

TEST_F(DatastoreTest, LoadHealthcareBands) {
    auto healthcare = load_healthcare_from_csv(file(info.healthcare));
    ASSERT_EQ(healthcare.size(), 5);
    EXPECT_EQ(healthcare.front().ages, core::IntegerInterval(0, 14));
    EXPECT_DOUBLE_EQ(healthcare.front().multiplier, 0.6);
    EXPECT_EQ(healthcare.back().ages, core::IntegerInterval(85, 100));
    EXPECT_DOUBLE_EQ(healthcare.back().multiplier, 5.5);
}

TEST_F(DatastoreTest, MissingFileThrowsException) {
    EXPECT_THROW(load_population_from_csv(file("not_a_file.csv")), std::runtime_error);
}

TEST_F(DatastoreTest, MissingColumnThrowsException) {
    auto file_name = write_temp_file("csim_employment.csv", "age,value\n0,0.0\n1,0.0\n");
    EXPECT_THROW(load_employment_from_csv(file_name), std::runtime_error);
}

TEST_F(DatastoreTest, DuplicatedAgeThrowsException) {
    auto file_name = write_temp_file("csim_fertility.csv", "age,rate\n20,15.0\n20,16.0\n");
    EXPECT_THROW(load_fertility_from_csv(file_name), std::runtime_error);
}

TEST_F(DatastoreTest, IncompletePopulationThrowsException) {
    auto file_name = write_temp_file("csim_population.csv", "age,male,female\n0,10,10\n1,10,10\n");
    EXPECT_THROW(load_population_from_csv(file_name), std::invalid_argument);
}

TEST_F(DatastoreTest, LoadReferenceData) {
    auto reference = load_reference_data(info, create_economy());
    EXPECT_EQ(reference.baseline().total(), 10749635);
    EXPECT_DOUBLE_EQ(reference.demographic().sex_ratio_at_birth, 1.05);
    EXPECT_DOUBLE_EQ(reference.demographic().migration_male_share, 0.48);
    EXPECT_DOUBLE_EQ(reference.economy().contribution_rate, 0.3475);
}

TEST_F(DatastoreTest, ProjectPortugalToEndOfCentury) {
    auto reference = load_reference_data(info, create_economy());
    auto parameters = SimulationParameters{};

    auto records = project(reference, 2024, 2100, parameters);
    ASSERT_EQ(records.size(), 77);

    const auto &first = records.front();
    EXPECT_EQ(first.year, 2024);
    EXPECT_EQ(first.summary.total_population, reference.baseline().total());
    EXPECT_DOUBLE_EQ(first.summary.dependency_ratio,
                     static_cast<double>(first.summary.retired_population) * 100.0 /
                         static_cast<double>(first.summary.working_population));

    for (const auto &record : records) {
        for (const auto &cohort : record.population) {
            ASSERT_GE(cohort.males, 0) << "year: " << record.year << ", age: " << cohort.age;
            ASSERT_GE(cohort.females, 0) << "year: " << record.year << ", age: " << cohort.age;
        }

        EXPECT_GE(record.economics.sustainability_index, 0.0);
        EXPECT_LE(record.economics.sustainability_index, 100.0);
        EXPECT_GT(record.summary.total_population, 0);
    }

    EXPECT_EQ(records.back().year, 2100);
}
