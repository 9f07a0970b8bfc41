#pragma once

#include "simulation_parameters.h"
#include "year_record.h"

#include <string>

namespace csim {

/// @brief Reply used when the advisory service returns no text
inline constexpr const char *advisory_empty_reply = "Unable to generate analysis.";

/// @brief Reply used when the advisory service fails
inline constexpr const char *advisory_service_error = "Analysis unavailable due to service error.";

/// @brief Defines the natural-language advisory service interface
class AdvisoryService {
  public:
    AdvisoryService() = default;
    AdvisoryService(const AdvisoryService &) = delete;
    AdvisoryService &operator=(const AdvisoryService &) = delete;
    AdvisoryService(AdvisoryService &&) = delete;
    AdvisoryService &operator=(AdvisoryService &&) = delete;

    /// @brief Destroys a AdvisoryService instance
    virtual ~AdvisoryService() = default;

    /// @brief Generates a narrative for a prompt
    /// @param prompt The prompt text
    /// @return The generated text, may be empty
    virtual std::string generate(const std::string &prompt) = 0;
};

/// @brief Creates the advisory prompt for one projected year
/// @param record The year record to analyse
/// @param parameters The simulation parameters that produced the record
/// @return The prompt text
std::string create_advisory_prompt(const YearRecord &record,
                                   const SimulationParameters &parameters);

/// @brief Requests the advisory narrative for one projected year
///
/// The projection results never depend on this call, service failures resolve to a fixed
/// fallback reply.
///
/// @param service The advisory service instance
/// @param record The year record to analyse
/// @param parameters The simulation parameters that produced the record
/// @return The service reply or the fallback reply
std::string request_advisory(AdvisoryService &service, const YearRecord &record,
                             const SimulationParameters &parameters) noexcept;

} // namespace csim
