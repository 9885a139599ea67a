#pragma once

#include "array2d.h"
#include "exception.h"
#include "forward_type.h"
#include "interval.h"
#include "math_util.h"

namespace spop {
/// \brief Top-level namespace for StablePop Core C++ API
namespace core {}
} // namespace spop
