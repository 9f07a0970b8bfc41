#pragma once

#include "CohortSim/year_record.h"

namespace csim {
/// @brief Defines the CohortSim projection results writer interface
class ResultWriter {
  public:
    /// @brief Destroys a csim::ResultWriter instance
    virtual ~ResultWriter() = default;

    /// @brief Writes a csim::YearRecord contents to a stream
    /// @param record The projected year to process
    virtual void write(const YearRecord &record) = 0;
};
} // namespace csim
