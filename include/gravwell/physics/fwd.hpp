/// @file fwd.hpp
/// @brief Forward declarations for gravwell_physics

#pragma once

#include <cstdint>

namespace gravwell_physics {

// =============================================================================
// Forward Declarations
// =============================================================================

// Core Types
struct PhysicsConfig;
struct PhysicsStats;
struct Contact;
struct CelestialId;

// Enums
enum class MotionState : std::uint8_t;
enum class ContactClass : std::uint8_t;
enum class CollidableType : std::uint8_t;

// Registries
struct CelestialBody;
class CelestialRegistry;
struct Collidable;
class CollisionRegistry;

// Simulation
struct DynamicBody;
class CollisionResolver;
class GravityIntegrator;
class SurfaceAligner;
class PlayerPhysicsStep;
class VehiclePhysicsStep;
class World;

// Scene
struct SceneConfig;

} // namespace gravwell_physics
