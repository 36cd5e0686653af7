/// @file scene.cpp
/// @brief Scene JSON parsing

#include <gravwell/physics/scene.hpp>

#include <gravwell/core/log.hpp>

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <system_error>

namespace gravwell_physics {

namespace gm = gravwell_math;

using gravwell_core::ConfigError;
using gravwell_core::Err;
using gravwell_core::Ok;
using gravwell_core::Result;

const char* to_string(SpawnKind kind) {
    switch (kind) {
        case SpawnKind::Player: return "Player";
        case SpawnKind::Vehicle: return "Vehicle";
    }
    return "Unknown";
}

namespace {

Result<gm::Vec3> parse_vec3(const nlohmann::json& j, const std::string& field) {
    if (!j.is_array() || j.size() != 3) {
        return Err<gm::Vec3>(ConfigError::invalid_value(field, "expected an array of 3 numbers"));
    }
    gm::Vec3 v;
    for (std::size_t i = 0; i < 3; ++i) {
        if (!j[i].is_number()) {
            return Err<gm::Vec3>(ConfigError::invalid_value(field, "expected an array of 3 numbers"));
        }
        v[static_cast<int>(i)] = j[i].get<float>();
    }
    return Ok(v);
}

/// Quaternion from [w, x, y, z] or from {"axis": [..], "angle_deg": n}
Result<gm::Quat> parse_rotation(const nlohmann::json& j, const std::string& field) {
    if (j.is_array() && j.size() == 4) {
        float c[4];
        for (std::size_t i = 0; i < 4; ++i) {
            if (!j[i].is_number()) {
                return Err<gm::Quat>(ConfigError::invalid_value(field, "expected [w, x, y, z]"));
            }
            c[i] = j[i].get<float>();
        }
        return Ok(gm::normalize_or_identity(gm::Quat(c[0], c[1], c[2], c[3])));
    }
    if (j.is_object() && j.contains("axis") && j.contains("angle_deg") && j["angle_deg"].is_number()) {
        auto axis = parse_vec3(j["axis"], field + ".axis");
        if (!axis) {
            return Err<gm::Quat>(axis.error());
        }
        const gm::Vec3 unit = gm::normalize_or(*axis, gm::vec3::UP);
        return Ok(gm::quat_from_axis_angle(unit, j["angle_deg"].get<float>() * gm::consts::DEG_TO_RAD));
    }
    return Err<gm::Quat>(ConfigError::invalid_value(field, "expected [w, x, y, z] or {axis, angle_deg}"));
}

Result<float> optional_number(const nlohmann::json& j, const char* key, float fallback, const std::string& where) {
    if (!j.contains(key)) {
        return Ok(fallback);
    }
    if (!j[key].is_number()) {
        return Err<float>(ConfigError::invalid_value(where + "." + key, "expected a number"));
    }
    return Ok(j[key].get<float>());
}

Result<ScenePlacement> parse_placement(const nlohmann::json& j, const std::string& where) {
    ScenePlacement placement;

    if (j.contains("surface")) {
        const auto& s = j["surface"];
        if (!s.is_object() || !s.contains("celestial") || !s["celestial"].is_string()) {
            return Err<ScenePlacement>(ConfigError::missing_field(where + ".surface.celestial"));
        }
        SurfacePlacement surface;
        surface.celestial = s["celestial"].get<std::string>();

        auto lat = optional_number(s, "latitude", 0.0f, where + ".surface");
        auto lon = optional_number(s, "longitude", 0.0f, where + ".surface");
        auto height = optional_number(s, "height", 0.0f, where + ".surface");
        for (const auto* r : {&lat, &lon, &height}) {
            if (!*r) {
                return Err<ScenePlacement>(r->error());
            }
        }
        surface.latitude = *lat;
        surface.longitude = *lon;
        surface.height = *height;
        placement.surface = surface;
    } else if (j.contains("position")) {
        auto position = parse_vec3(j["position"], where + ".position");
        if (!position) {
            return Err<ScenePlacement>(position.error());
        }
        placement.position = *position;
    } else {
        return Err<ScenePlacement>(ConfigError::missing_field(where + ".position"));
    }

    if (j.contains("rotation")) {
        auto rotation = parse_rotation(j["rotation"], where + ".rotation");
        if (!rotation) {
            return Err<ScenePlacement>(rotation.error());
        }
        placement.rotation = *rotation;
    }
    return Ok(placement);
}

Result<CelestialDesc> parse_celestial(const nlohmann::json& j, const std::string& where) {
    if (!j.is_object()) {
        return Err<CelestialDesc>(ConfigError::invalid_value(where, "expected an object"));
    }
    if (!j.contains("name") || !j["name"].is_string()) {
        return Err<CelestialDesc>(ConfigError::missing_field(where + ".name"));
    }
    if (!j.contains("radius") || !j["radius"].is_number()) {
        return Err<CelestialDesc>(ConfigError::missing_field(where + ".radius"));
    }

    CelestialDesc desc;
    desc.name = j["name"].get<std::string>();
    desc.radius = j["radius"].get<float>();
    if (!(desc.radius > 0.0f)) {
        return Err<CelestialDesc>(ConfigError::invalid_value(where + ".radius", "must be > 0"));
    }

    if (j.contains("center")) {
        auto center = parse_vec3(j["center"], where + ".center");
        if (!center) {
            return Err<CelestialDesc>(center.error());
        }
        desc.center = *center;
    }

    auto friction = optional_number(j, "friction", desc.friction, where);
    if (!friction) {
        return Err<CelestialDesc>(friction.error());
    }
    desc.friction = *friction;
    return Ok(desc);
}

Result<SceneObstacle> parse_obstacle(const nlohmann::json& j, const std::string& where) {
    if (!j.is_object()) {
        return Err<SceneObstacle>(ConfigError::invalid_value(where, "expected an object"));
    }

    SceneObstacle obstacle;
    if (j.contains("name") && j["name"].is_string()) {
        obstacle.name = j["name"].get<std::string>();
    }

    auto placement = parse_placement(j, where);
    if (!placement) {
        return Err<SceneObstacle>(placement.error());
    }
    obstacle.placement = *placement;

    if (!j.contains("half_extents")) {
        return Err<SceneObstacle>(ConfigError::missing_field(where + ".half_extents"));
    }
    auto half_extents = parse_vec3(j["half_extents"], where + ".half_extents");
    if (!half_extents) {
        return Err<SceneObstacle>(half_extents.error());
    }
    if (gm::min_component(*half_extents) <= 0.0f) {
        return Err<SceneObstacle>(ConfigError::invalid_value(where + ".half_extents", "must be > 0"));
    }
    obstacle.half_extents = *half_extents;

    if (j.contains("offset")) {
        auto offset = parse_vec3(j["offset"], where + ".offset");
        if (!offset) {
            return Err<SceneObstacle>(offset.error());
        }
        obstacle.offset = *offset;
    }

    if (j.contains("anchor")) {
        if (!j["anchor"].is_string()) {
            return Err<SceneObstacle>(ConfigError::invalid_value(where + ".anchor", "expected a celestial name"));
        }
        obstacle.anchor = j["anchor"].get<std::string>();
    } else if (obstacle.placement.surface) {
        obstacle.anchor = obstacle.placement.surface->celestial;
    }
    return Ok(obstacle);
}

Result<SceneSpawn> parse_spawn(const nlohmann::json& j, const std::string& where) {
    if (!j.is_object()) {
        return Err<SceneSpawn>(ConfigError::invalid_value(where, "expected an object"));
    }
    if (!j.contains("kind") || !j["kind"].is_string()) {
        return Err<SceneSpawn>(ConfigError::missing_field(where + ".kind"));
    }

    SceneSpawn spawn;
    const auto kind = j["kind"].get<std::string>();
    if (kind == "player") {
        spawn.kind = SpawnKind::Player;
    } else if (kind == "vehicle") {
        spawn.kind = SpawnKind::Vehicle;
    } else {
        return Err<SceneSpawn>(ConfigError::invalid_value(where + ".kind", "unknown spawn kind: " + kind));
    }

    spawn.name = (j.contains("name") && j["name"].is_string()) ? j["name"].get<std::string>() : kind;

    auto placement = parse_placement(j, where);
    if (!placement) {
        return Err<SceneSpawn>(placement.error());
    }
    spawn.placement = *placement;

    if (j.contains("velocity")) {
        auto velocity = parse_vec3(j["velocity"], where + ".velocity");
        if (!velocity) {
            return Err<SceneSpawn>(velocity.error());
        }
        spawn.velocity = *velocity;
    }

    if (j.contains("mass")) {
        if (!j["mass"].is_number() || !(j["mass"].get<float>() > 0.0f)) {
            return Err<SceneSpawn>(ConfigError::invalid_value(where + ".mass", "must be a number > 0"));
        }
        spawn.mass = j["mass"].get<float>();
    }

    if (j.contains("occupied") && j["occupied"].is_boolean()) {
        spawn.occupied = j["occupied"].get<bool>();
    }
    return Ok(spawn);
}

/// Parse every element of an optional array field
template<typename T, typename F>
Result<std::vector<T>> parse_list(const nlohmann::json& j, const char* key, F&& parse_one) {
    std::vector<T> items;
    if (!j.contains(key)) {
        return Ok(std::move(items));
    }
    if (!j[key].is_array()) {
        return Err<std::vector<T>>(ConfigError::invalid_value(key, "expected an array"));
    }
    for (std::size_t i = 0; i < j[key].size(); ++i) {
        auto item = parse_one(j[key][i], std::string(key) + "[" + std::to_string(i) + "]");
        if (!item) {
            return Err<std::vector<T>>(item.error());
        }
        items.push_back(std::move(*item));
    }
    return Ok(std::move(items));
}

} // anonymous namespace

// =============================================================================
// SceneConfig
// =============================================================================

Result<SceneConfig> SceneConfig::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return Err<SceneConfig>(ConfigError::parse("scene root must be an object"));
    }

    SceneConfig scene;

    if (j.contains("physics")) {
        auto physics = PhysicsConfig::from_json(j["physics"]);
        if (!physics) {
            return Err<SceneConfig>(physics.error());
        }
        scene.physics = *physics;
    }

    auto celestials = parse_list<CelestialDesc>(j, "celestials", parse_celestial);
    if (!celestials) {
        return Err<SceneConfig>(celestials.error());
    }
    scene.celestials = std::move(*celestials);

    auto obstacles = parse_list<SceneObstacle>(j, "obstacles", parse_obstacle);
    if (!obstacles) {
        return Err<SceneConfig>(obstacles.error());
    }
    scene.obstacles = std::move(*obstacles);

    auto spawns = parse_list<SceneSpawn>(j, "spawns", parse_spawn);
    if (!spawns) {
        return Err<SceneConfig>(spawns.error());
    }
    scene.spawns = std::move(*spawns);

    return Ok(std::move(scene));
}

Result<SceneConfig> SceneConfig::from_json_string(const std::string& text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        return Err<SceneConfig>(ConfigError::parse(e.what()));
    }
    return from_json(j);
}

Result<SceneConfig> load_scene_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Err<SceneConfig>(ConfigError::io(path.string()));
    }

    std::ifstream file(path);
    if (!file) {
        return Err<SceneConfig>(ConfigError::io(path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto result = SceneConfig::from_json_string(buffer.str());
    if (!result) {
        gravwell_core::config_logger()->error("Failed to load scene '{}': {}", path.string(),
                                              result.error().message());
        result.error().with_context("path", path.string());
    }
    return result;
}

Result<gm::Transform> resolve_placement(const ScenePlacement& placement, const CelestialRegistry& celestials) {
    if (!placement.surface) {
        return Ok(gm::Transform::from_position_rotation(placement.position, placement.rotation));
    }

    const CelestialBody* body = celestials.find(placement.surface->celestial);
    if (!body) {
        return Err<gm::Transform>(ConfigError::invalid_value("celestial",
                                                             "unknown body: " + placement.surface->celestial));
    }
    gm::Transform transform = CelestialRegistry::surface_point(*body, placement.surface->latitude,
                                                              placement.surface->longitude,
                                                              placement.surface->height);
    transform.rotation = gm::normalize_or_identity(transform.rotation * placement.rotation);
    return Ok(transform);
}

} // namespace gravwell_physics
