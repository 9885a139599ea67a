#pragma once

#include "StablePop.Core/api.h"

#include "demographic_tables.h"
#include "error_message.h"
#include "event_bus.h"
#include "event_logger.h"
#include "info_message.h"
#include "nelder_mead.h"
#include "optimiser.h"
#include "parameters.h"
#include "population.h"
#include "population_simulator.h"
#include "result_message.h"
#include "simulation.h"
#include "timeline.h"

/// @brief Top-level namespace for StablePop C++ API
namespace spop {}
