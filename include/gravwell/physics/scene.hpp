/// @file scene.hpp
/// @brief Scene description and JSON loading

#pragma once

#include "fwd.hpp"
#include "config.hpp"
#include "celestial.hpp"

#include <gravwell/core/error.hpp>
#include <gravwell/math/quat.hpp>

#include <nlohmann/json_fwd.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace gravwell_physics {

/// Latitude / longitude / height on a named celestial body
struct SurfacePlacement {
    std::string celestial;
    float latitude = 0.0f;     ///< Degrees
    float longitude = 0.0f;    ///< Degrees
    float height = 0.0f;       ///< Above the surface
};

/// World pose, or a surface pose that overrides it
struct ScenePlacement {
    gravwell_math::Vec3 position{0.0f};
    gravwell_math::Quat rotation = gravwell_math::quat::IDENTITY;
    std::optional<SurfacePlacement> surface;
};

struct SceneObstacle {
    std::string name;
    ScenePlacement placement;
    gravwell_math::Vec3 half_extents{0.5f};
    gravwell_math::Vec3 offset{0.0f};
    std::string anchor;         ///< Celestial name; defaults to the surface placement's body
};

enum class SpawnKind : std::uint8_t {
    Player,
    Vehicle,
};

struct SceneSpawn {
    SpawnKind kind = SpawnKind::Player;
    std::string name;
    ScenePlacement placement;
    gravwell_math::Vec3 velocity{0.0f};
    std::optional<float> mass;
    bool occupied = false;
};

/// Everything World::load_scene needs
struct SceneConfig {
    PhysicsConfig physics;
    std::vector<CelestialDesc> celestials;
    std::vector<SceneObstacle> obstacles;
    std::vector<SceneSpawn> spawns;

    [[nodiscard]] static gravwell_core::Result<SceneConfig> from_json(const nlohmann::json& j);
    [[nodiscard]] static gravwell_core::Result<SceneConfig> from_json_string(const std::string& text);
};

/// Read and parse a scene file
[[nodiscard]] gravwell_core::Result<SceneConfig> load_scene_file(const std::filesystem::path& path);

/// Resolve a placement against the registered celestial bodies
[[nodiscard]] gravwell_core::Result<gravwell_math::Transform> resolve_placement(const ScenePlacement& placement,
                                                                               const CelestialRegistry& celestials);

[[nodiscard]] const char* to_string(SpawnKind kind);

} // namespace gravwell_physics
