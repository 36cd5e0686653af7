/// @file body.cpp
/// @brief DynamicBody implementation

#include <gravwell/physics/body.hpp>

#include <cmath>

namespace gravwell_physics {

namespace gm = gravwell_math;

float DynamicBody::ground_offset() const {
    if (const auto* vehicle = std::get_if<VehicleParams>(&kind)) {
        return vehicle->target_height;
    }
    return std::get<PlayerParams>(kind).ground_offset;
}

gm::LocalBox DynamicBody::local_box() const {
    return std::visit([](const auto& params) {
        return gm::LocalBox{gm::vec3::ZERO, params.half_extents};
    }, kind);
}

gm::Transform DynamicBody::transform() const {
    return gm::Transform::from_position_rotation(position, orientation);
}

gm::OrientedBox DynamicBody::box() const {
    return gm::OrientedBox::from_transform(transform(), local_box()).sanitized();
}

bool DynamicBody::sanitize() {
    bool repaired = false;

    if (!gm::is_finite(position)) {
        position = gm::is_finite(last_valid_position) ? last_valid_position : gm::vec3::ZERO;
        repaired = true;
    }
    if (!gm::is_finite(velocity)) {
        velocity = gm::vec3::ZERO;
        repaired = true;
    }

    if (!gm::is_finite(orientation) || glm::length2(orientation) < gm::consts::EPSILON) {
        orientation = gm::normalize_or_identity(last_valid_orientation);
        repaired = true;
    } else {
        orientation = glm::normalize(orientation);
    }

    if (!std::isfinite(mass) || mass <= 0.0f) {
        mass = (std::isfinite(last_valid_mass) && last_valid_mass > 0.0f) ? last_valid_mass : 1.0f;
        repaired = true;
    }
    if (!std::isfinite(gravity_scale)) {
        gravity_scale = 1.0f;
        repaired = true;
    }
    return repaired;
}

void DynamicBody::remember_valid() {
    last_valid_position = position;
    last_valid_orientation = orientation;
    last_valid_mass = mass;
}

} // namespace gravwell_physics
