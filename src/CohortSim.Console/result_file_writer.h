#pragma once
#include <filesystem>
#include <fstream>
#include <mutex>

#include "model_info.h"
#include "result_writer.h"

namespace csim {
/// @brief Defines the projection results file stream writer class
///
/// The experiment information and one entry per projected year, including the full
/// age-gender structure, are written to a JSON (JavaScript Object Notation) file, while the
/// `time-series` indicators are written to an associated CSV (Comma-separated Values) file
/// with same name but different extension.
class ResultFileWriter final : public ResultWriter {
  public:
    ResultFileWriter() = delete;
    /// @brief Initialises an instance of the csim::ResultFileWriter class.
    /// @param file_name The JSON output file full name
    /// @param info The associated experiment information
    /// @throws std::invalid_argument if the output files can not be opened.
    ResultFileWriter(const std::filesystem::path &file_name, ExperimentInfo info);

    ResultFileWriter(const ResultFileWriter &) = delete;
    ResultFileWriter &operator=(const ResultFileWriter &) = delete;
    ResultFileWriter(ResultFileWriter &&other) noexcept;
    ResultFileWriter &operator=(ResultFileWriter &&other) noexcept;

    /// @brief Destroys a csim::ResultFileWriter instance
    ~ResultFileWriter();

    void write(const YearRecord &record) override;

  private:
    std::ofstream stream_;
    std::ofstream csvstream_;
    std::mutex lock_mutex_;
    bool first_row_{true};
    ExperimentInfo info_;

    void write_json_begin(const std::filesystem::path &output);
    void write_json_end();

    static std::string to_json_string(const YearRecord &record);
    void write_csv_header();
    void write_csv_channels(const YearRecord &record);
};
} // namespace csim
