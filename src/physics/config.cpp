/// @file config.cpp
/// @brief PhysicsConfig validation and JSON mapping

#include <gravwell/physics/config.hpp>

#include <nlohmann/json.hpp>

#include <cmath>
#include <string>

namespace gravwell_physics {

namespace {

using gravwell_core::ConfigError;
using gravwell_core::Err;
using gravwell_core::Ok;
using gravwell_core::Result;

Result<void> read_float(const nlohmann::json& j, const char* key, float& out) {
    if (!j.contains(key)) {
        return Ok();
    }
    if (!j[key].is_number()) {
        return Err(ConfigError::invalid_value(key, "expected a number"));
    }
    out = j[key].get<float>();
    return Ok();
}

Result<void> read_count(const nlohmann::json& j, const char* key, std::uint32_t& out) {
    if (!j.contains(key)) {
        return Ok();
    }
    if (!j[key].is_number_integer() || j[key].get<std::int64_t>() < 0) {
        return Err(ConfigError::invalid_value(key, "expected a non-negative integer"));
    }
    out = j[key].get<std::uint32_t>();
    return Ok();
}

Result<void> check(bool condition, const char* field, const char* reason) {
    if (!condition) {
        return Err(ConfigError::invalid_value(field, reason));
    }
    return Ok();
}

bool positive(float v) { return std::isfinite(v) && v > 0.0f; }
bool non_negative(float v) { return std::isfinite(v) && v >= 0.0f; }
bool unit_range(float v) { return std::isfinite(v) && v >= 0.0f && v <= 1.0f; }

} // anonymous namespace

PhysicsConfig PhysicsConfig::defaults() {
    return PhysicsConfig{};
}

gravwell_core::Result<void> PhysicsConfig::validate() const {
    const Result<void> checks[] = {
        check(non_negative(gravity_constant), "gravity_constant", "must be finite and >= 0"),
        check(non_negative(vehicle_gravity_scale), "vehicle_gravity_scale", "must be finite and >= 0"),
        check(positive(max_speed), "max_speed", "must be > 0"),
        check(positive(substep_speed_threshold), "substep_speed_threshold", "must be > 0"),
        check(max_substeps >= 1, "max_substeps", "must be >= 1"),
        check(non_negative(ground_offset), "ground_offset", "must be >= 0"),
        check(non_negative(liftoff_threshold), "liftoff_threshold", "must be >= 0"),
        check(non_negative(vehicle_target_height), "vehicle_target_height", "must be >= 0"),
        check(non_negative(safety_buffer), "safety_buffer", "must be >= 0"),
        check(unit_range(slide_friction), "slide_friction", "must be in [0, 1]"),
        check(std::isfinite(ground_contact_threshold) && std::isfinite(ceiling_contact_threshold) &&
              ceiling_contact_threshold < ground_contact_threshold,
              "ceiling_contact_threshold", "must be below ground_contact_threshold"),
        check(unit_range(default_restitution), "default_restitution", "must be in [0, 1]"),
        check(non_negative(broadphase_margin), "broadphase_margin", "must be >= 0"),
        check(sweep_samples >= 1, "sweep_samples", "must be >= 1"),
        check(non_negative(alignment_rate), "alignment_rate", "must be >= 0"),
        check(non_negative(vehicle_alignment_rate), "vehicle_alignment_rate", "must be >= 0"),
        check(!fixed_alignment_factor || unit_range(*fixed_alignment_factor),
              "fixed_alignment_factor", "must be in [0, 1]"),
        check(positive(player_mass), "player_mass", "must be > 0"),
        check(positive(vehicle_mass), "vehicle_mass", "must be > 0"),
    };

    for (const auto& result : checks) {
        if (!result) {
            return result;
        }
    }
    return Ok();
}

gravwell_core::Result<PhysicsConfig> PhysicsConfig::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return Err<PhysicsConfig>(ConfigError::invalid_value("physics", "expected an object"));
    }

    PhysicsConfig config;

    const std::pair<const char*, float*> floats[] = {
        {"gravity_constant", &config.gravity_constant},
        {"vehicle_gravity_scale", &config.vehicle_gravity_scale},
        {"max_speed", &config.max_speed},
        {"substep_speed_threshold", &config.substep_speed_threshold},
        {"ground_offset", &config.ground_offset},
        {"liftoff_threshold", &config.liftoff_threshold},
        {"vehicle_target_height", &config.vehicle_target_height},
        {"safety_buffer", &config.safety_buffer},
        {"slide_friction", &config.slide_friction},
        {"ground_contact_threshold", &config.ground_contact_threshold},
        {"ceiling_contact_threshold", &config.ceiling_contact_threshold},
        {"default_restitution", &config.default_restitution},
        {"broadphase_margin", &config.broadphase_margin},
        {"alignment_rate", &config.alignment_rate},
        {"vehicle_alignment_rate", &config.vehicle_alignment_rate},
        {"player_mass", &config.player_mass},
        {"vehicle_mass", &config.vehicle_mass},
    };
    for (const auto& [key, field] : floats) {
        auto result = read_float(j, key, *field);
        if (!result) {
            return Err<PhysicsConfig>(result.error());
        }
    }

    const std::pair<const char*, std::uint32_t*> counts[] = {
        {"max_substeps", &config.max_substeps},
        {"sweep_samples", &config.sweep_samples},
        {"sweep_refine_iterations", &config.sweep_refine_iterations},
    };
    for (const auto& [key, field] : counts) {
        auto result = read_count(j, key, *field);
        if (!result) {
            return Err<PhysicsConfig>(result.error());
        }
    }

    if (j.contains("fixed_alignment_factor") && !j["fixed_alignment_factor"].is_null()) {
        float factor = 0.0f;
        auto result = read_float(j, "fixed_alignment_factor", factor);
        if (!result) {
            return Err<PhysicsConfig>(result.error());
        }
        config.fixed_alignment_factor = factor;
    }

    auto valid = config.validate();
    if (!valid) {
        return Err<PhysicsConfig>(valid.error());
    }
    return Ok(config);
}

nlohmann::json PhysicsConfig::to_json() const {
    nlohmann::json j = {
        {"gravity_constant", gravity_constant},
        {"vehicle_gravity_scale", vehicle_gravity_scale},
        {"max_speed", max_speed},
        {"substep_speed_threshold", substep_speed_threshold},
        {"max_substeps", max_substeps},
        {"ground_offset", ground_offset},
        {"liftoff_threshold", liftoff_threshold},
        {"vehicle_target_height", vehicle_target_height},
        {"safety_buffer", safety_buffer},
        {"slide_friction", slide_friction},
        {"ground_contact_threshold", ground_contact_threshold},
        {"ceiling_contact_threshold", ceiling_contact_threshold},
        {"default_restitution", default_restitution},
        {"broadphase_margin", broadphase_margin},
        {"sweep_samples", sweep_samples},
        {"sweep_refine_iterations", sweep_refine_iterations},
        {"alignment_rate", alignment_rate},
        {"vehicle_alignment_rate", vehicle_alignment_rate},
        {"player_mass", player_mass},
        {"vehicle_mass", vehicle_mass},
    };
    if (fixed_alignment_factor) {
        j["fixed_alignment_factor"] = *fixed_alignment_factor;
    } else {
        j["fixed_alignment_factor"] = nullptr;
    }
    return j;
}

} // namespace gravwell_physics
