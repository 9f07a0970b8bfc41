#pragma once

#include "configuration.h"
#include "csvparser.h"
#include "jsonparser.h"
#include "schema.h"

/// \brief Configuration and reference data loading namespace
namespace csim::input {}
