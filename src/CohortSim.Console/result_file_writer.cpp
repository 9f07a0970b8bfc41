#include "result_file_writer.h"

#include <fmt/chrono.h>
#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <stdexcept>
#include <utility>

namespace csim {
ResultFileWriter::ResultFileWriter(const std::filesystem::path &file_name, ExperimentInfo info)
    : info_{std::move(info)} {
    stream_.open(file_name, std::ofstream::out | std::ofstream::trunc);
    if (stream_.fail() || !stream_.is_open()) {
        throw std::invalid_argument(fmt::format("Cannot open output file: {}", file_name.string()));
    }

    auto output_filename = file_name;
    output_filename.replace_extension("csv");
    csvstream_.open(output_filename, std::ofstream::out | std::ofstream::trunc);
    if (csvstream_.fail() || !csvstream_.is_open()) {
        throw std::invalid_argument(
            fmt::format("Cannot open output file: {}", output_filename.string()));
    }

    write_json_begin(output_filename);
    write_csv_header();
}

ResultFileWriter::ResultFileWriter(ResultFileWriter &&other) noexcept
    : stream_{std::move(other.stream_)}, csvstream_{std::move(other.csvstream_)},
      first_row_{other.first_row_}, info_{std::move(other.info_)} {}

ResultFileWriter &ResultFileWriter::operator=(ResultFileWriter &&other) noexcept {
    stream_.close();
    stream_ = std::move(other.stream_);

    csvstream_.close();
    csvstream_ = std::move(other.csvstream_);

    first_row_ = other.first_row_;
    info_ = std::move(other.info_);
    return *this;
}

ResultFileWriter::~ResultFileWriter() {
    if (stream_.is_open()) {
        write_json_end();
        stream_.flush();
        stream_.close();
    }

    if (csvstream_.is_open()) {
        csvstream_.flush();
        csvstream_.close();
    }
}

void ResultFileWriter::write(const YearRecord &record) {
    std::scoped_lock lock(lock_mutex_);
    if (first_row_) {
        first_row_ = false;
    } else {
        stream_ << ",";
    }

    stream_ << to_json_string(record);
    write_csv_channels(record);
}

void ResultFileWriter::write_json_begin(const std::filesystem::path &output) {
    using json = nlohmann::ordered_json;

    auto tp = std::chrono::system_clock::now();
    json msg = {
        {"experiment",
         {{"model", info_.model},
          {"version", info_.version},
          {"scenario", info_.scenario},
          {"start_year", info_.start_year},
          {"end_year", info_.end_year},
          {"time_of_day", fmt::format("{0:%F %H:%M:}{1:%S} {0:%Z}", tp, tp.time_since_epoch())},
          {"output_filename", output.filename().string()}}},
        {"result", {1, 2}}};

    const auto &params = info_.parameters;
    msg["experiment"]["parameters"] = {
        {"retirement_age", params.retirement_age},
        {"fertility_rate", params.fertility_rate},
        {"net_migration", params.net_migration},
        {"mortality_improvement",
         {{"male", params.mortality_improvement.male},
          {"female", params.mortality_improvement.female}}},
        {"entry_age_shift", params.entry_age_shift},
        {"unemployment_adjustment", params.unemployment_adjustment}};

    auto json_header = msg.dump();
    auto array_start = json_header.find_last_of('[');
    stream_ << json_header.substr(0, array_start + 1);
    stream_.flush();
}

void ResultFileWriter::write_json_end() { stream_ << "]}"; }

std::string ResultFileWriter::to_json_string(const YearRecord &record) {
    using json = nlohmann::ordered_json;

    const auto &summary = record.summary;
    const auto &economics = record.economics;
    json msg = {
        {"year", record.year},
        {"population",
         {
             {"total", record.population.total()},
             {"males", record.population.total_males()},
             {"females", record.population.total_females()},
         }},
        {"summary",
         {
             {"child_population", summary.child_population},
             {"working_population", summary.working_population},
             {"retired_population", summary.retired_population},
             {"dependency_ratio", summary.dependency_ratio},
             {"median_age", summary.median_age},
         }},
        {"economics",
         {
             {"actual_workforce", economics.actual_workforce},
             {"actual_pensioners", economics.actual_pensioners},
             {"working_age_population", economics.working_age_population},
             {"labour_utilisation_rate", economics.labour_utilisation_rate},
             {"contributions", economics.contributions},
             {"pension_payments", economics.pension_payments},
             {"social_security_balance", economics.social_security_balance},
             {"social_security_deficit", economics.social_security_deficit},
             {"balance_per_worker", economics.balance_per_worker},
             {"healthcare_cost", economics.healthcare_cost},
             {"public_healthcare_cost", economics.public_healthcare_cost},
             {"healthcare_cost_per_worker", economics.healthcare_cost_per_worker},
             {"burden_per_worker", economics.burden_per_worker},
             {"gdp_proxy", economics.gdp_proxy},
             {"sustainability_index", economics.sustainability_index},
             {"sustainability_level",
              to_string(classify_sustainability(economics.sustainability_index))},
         }},
    };

    auto pyramid = json::array();
    for (const auto &cohort : record.population) {
        pyramid.push_back({cohort.age, cohort.males, cohort.females});
    }

    msg["population"]["cohorts"] = std::move(pyramid);
    return msg.dump();
}

void ResultFileWriter::write_csv_header() {
    csvstream_ << "scenario,year,total_population,males,females,child_population,"
                  "working_population,retired_population,dependency_ratio,median_age,"
                  "actual_workforce,actual_pensioners,working_age_population,"
                  "labour_utilisation_rate,contributions,pension_payments,"
                  "social_security_balance,social_security_deficit,balance_per_worker,"
                  "healthcare_cost,public_healthcare_cost,healthcare_cost_per_worker,"
                  "burden_per_worker,gdp_proxy,sustainability_index\n";
    csvstream_.flush();
}

void ResultFileWriter::write_csv_channels(const YearRecord &record) {
    const auto &summary = record.summary;
    const auto &eco = record.economics;
    csvstream_ << fmt::format("{},{},{},{},{},{},{},{},{},{},", info_.scenario, record.year,
                              record.population.total(), record.population.total_males(),
                              record.population.total_females(), summary.child_population,
                              summary.working_population, summary.retired_population,
                              summary.dependency_ratio, summary.median_age);

    csvstream_ << fmt::format("{},{},{},{},{},{},{},{},{},{},{},{},{},{},{}\n",
                              eco.actual_workforce, eco.actual_pensioners,
                              eco.working_age_population, eco.labour_utilisation_rate,
                              eco.contributions, eco.pension_payments,
                              eco.social_security_balance, eco.social_security_deficit,
                              eco.balance_per_worker, eco.healthcare_cost,
                              eco.public_healthcare_cost, eco.healthcare_cost_per_worker,
                              eco.burden_per_worker, eco.gdp_proxy, eco.sustainability_index);
}
} // namespace csim
