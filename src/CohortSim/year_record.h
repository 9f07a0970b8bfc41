#pragma once

#include "economic_metrics.h"
#include "population_snapshot.h"

namespace csim {

/// @brief One element of the projection output time series
struct YearRecord {
    /// @brief The calendar year
    int year{};

    /// @brief The year population
    PopulationSnapshot population;

    /// @brief The population age band aggregates
    PopulationSummary summary;

    /// @brief The year economic indicators
    EconomicMetrics economics;
};

} // namespace csim
