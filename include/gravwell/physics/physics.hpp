/// @file physics.hpp
/// @brief Main include for gravwell_physics

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "config.hpp"
#include "celestial.hpp"
#include "collision_registry.hpp"
#include "collision_resolver.hpp"
#include "body.hpp"
#include "gravity.hpp"
#include "alignment.hpp"
#include "character.hpp"
#include "vehicle.hpp"
#include "world.hpp"
#include "scene.hpp"

#include <gravwell/core/log.hpp>
#include <gravwell/math/math.hpp>

namespace gravwell_physics {

/// Library version
inline constexpr const char* VERSION = "0.1.0";

} // namespace gravwell_physics
