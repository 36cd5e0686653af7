/// @file celestial.cpp
/// @brief CelestialRegistry implementation

#include <gravwell/physics/celestial.hpp>

#include <gravwell/core/log.hpp>
#include <gravwell/math/constants.hpp>
#include <gravwell/math/quat.hpp>

#include <algorithm>
#include <cmath>

namespace gravwell_physics {

using gravwell_core::Err;
using gravwell_core::Ok;
using gravwell_core::PhysicsError;

gravwell_core::Result<CelestialId> CelestialRegistry::add(const CelestialDesc& desc) {
    if (!std::isfinite(desc.radius) || desc.radius <= 0.0f) {
        return Err<CelestialId>(PhysicsError::invalid_parameter("radius", "must be finite and > 0"));
    }
    if (!gravwell_math::is_finite(desc.center)) {
        return Err<CelestialId>(PhysicsError::invalid_parameter("center", "must be finite"));
    }

    CelestialBody body;
    body.id = CelestialId{static_cast<std::uint32_t>(m_bodies.size())};
    body.name = desc.name;
    body.radius = desc.radius;
    body.center = desc.center;
    body.friction = std::isfinite(desc.friction) ? std::clamp(desc.friction, 0.0f, 1.0f) : 0.0f;

    m_bodies.push_back(std::move(body));
    m_warned_empty = false;

    gravwell_core::physics_logger()->debug("Added celestial body '{}' (radius {}, friction {})",
                                           desc.name, desc.radius, m_bodies.back().friction);
    return Ok(m_bodies.back().id);
}

gravwell_core::Result<void> CelestialRegistry::attach_obstacle(CelestialId id, CollidableId obstacle) {
    if (!id.is_valid() || id.value >= m_bodies.size()) {
        return Err(PhysicsError::missing_body("celestial#" + std::to_string(id.value)));
    }
    auto& list = m_bodies[id.value].obstacles;
    if (std::find(list.begin(), list.end(), obstacle) == list.end()) {
        list.push_back(obstacle);
    }
    return Ok();
}

void CelestialRegistry::detach_obstacle(CollidableId obstacle) {
    for (auto& body : m_bodies) {
        auto it = std::remove(body.obstacles.begin(), body.obstacles.end(), obstacle);
        body.obstacles.erase(it, body.obstacles.end());
    }
}

gravwell_core::Result<void> CelestialRegistry::set_center(CelestialId id, const gravwell_math::Vec3& center) {
    if (!id.is_valid() || id.value >= m_bodies.size()) {
        return Err(PhysicsError::missing_body("celestial#" + std::to_string(id.value)));
    }
    if (!gravwell_math::is_finite(center)) {
        return Err(PhysicsError::degenerate_input("celestial center"));
    }
    m_bodies[id.value].center = center;
    return Ok();
}

const CelestialBody* CelestialRegistry::get(CelestialId id) const {
    if (!id.is_valid() || id.value >= m_bodies.size()) {
        return nullptr;
    }
    return &m_bodies[id.value];
}

const CelestialBody* CelestialRegistry::find(const std::string& name) const {
    auto it = std::find_if(m_bodies.begin(), m_bodies.end(),
                           [&name](const CelestialBody& b) { return b.name == name; });
    return it != m_bodies.end() ? &*it : nullptr;
}

void CelestialRegistry::clear() {
    m_bodies.clear();
    m_warned_empty = false;
}

const CelestialBody& CelestialRegistry::resolve_soi(const gravwell_math::Vec3& position) const {
    if (m_bodies.empty()) {
        if (!m_warned_empty) {
            gravwell_core::physics_logger()->warn("No celestial bodies registered, using fallback body");
            m_warned_empty = true;
        }
        return fallback_body();
    }

    // NaN ratios never compare less, so a non-finite position keeps the first body
    const CelestialBody* best = &m_bodies.front();
    float best_ratio = gravwell_math::distance(position, best->center) / best->radius;

    for (std::size_t i = 1; i < m_bodies.size(); ++i) {
        const CelestialBody& body = m_bodies[i];
        const float ratio = gravwell_math::distance(position, body.center) / body.radius;
        if (ratio < best_ratio) {
            best_ratio = ratio;
            best = &body;
        }
    }
    return *best;
}

const CelestialBody& CelestialRegistry::fallback_body() {
    static const CelestialBody fallback{CelestialId::invalid(), "fallback", 1.0f,
                                        gravwell_math::Vec3{0.0f}, 0.0f, {}};
    return fallback;
}

gravwell_math::Transform CelestialRegistry::surface_point(const CelestialBody& body,
                                                          float latitude_deg,
                                                          float longitude_deg,
                                                          float height) {
    namespace gm = gravwell_math;

    const float lat = latitude_deg * gm::consts::DEG_TO_RAD;
    const float lon = longitude_deg * gm::consts::DEG_TO_RAD;
    const gm::Vec3 dir = gm::normalize_or(
        gm::Vec3(std::cos(lat) * std::cos(lon), std::sin(lat), std::cos(lat) * std::sin(lon)),
        gm::vec3::UP);

    const gm::Vec3 position = body.center + dir * (body.radius + height);
    const gm::Quat rotation = gm::quat_from_rotation_arc(gm::vec3::UP, dir);
    return gm::Transform::from_position_rotation(position, rotation);
}

} // namespace gravwell_physics
