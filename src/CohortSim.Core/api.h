#pragma once

#include "array2d.h"
#include "exception.h"
#include "forward_type.h"
#include "interval.h"
#include "string_util.h"

namespace csim {
/// \brief Top-level namespace for CohortSim Core C++ API
namespace core {}
} // namespace csim
