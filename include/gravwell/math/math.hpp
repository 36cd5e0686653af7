#pragma once

/// @file math.hpp
/// @brief Main include header for gravwell_math

#include "fwd.hpp"
#include "constants.hpp"
#include "types.hpp"
#include "vec.hpp"
#include "quat.hpp"
#include "transform.hpp"
#include "obb.hpp"
#include "intersect.hpp"

/// Short alias
namespace gmath = gravwell_math;
