#pragma once

#include "advisory.h"
#include "balance_message.h"
#include "balance_validator.h"
#include "cohort_evolution.h"
#include "demographic_rates.h"
#include "economic_metrics.h"
#include "error_message.h"
#include "event_bus.h"
#include "info_message.h"
#include "population_snapshot.h"
#include "projection.h"
#include "reference_data.h"
#include "runner.h"
#include "runner_message.h"
#include "scenario.h"
#include "simulation_parameters.h"
#include "year_record.h"

/// \brief Top-level namespace for CohortSim C++ API
namespace csim {}
