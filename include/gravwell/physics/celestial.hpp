/// @file celestial.hpp
/// @brief Celestial bodies and sphere-of-influence resolution

#pragma once

#include "fwd.hpp"
#include "types.hpp"

#include <gravwell/core/error.hpp>
#include <gravwell/math/transform.hpp>

#include <span>
#include <string>
#include <vector>

namespace gravwell_physics {

// =============================================================================
// Celestial Body
// =============================================================================

/// Spherical gravity source
struct CelestialBody {
    CelestialId id;
    std::string name;
    float radius = 1.0f;
    gravwell_math::Vec3 center{0.0f};
    float friction = 0.0f;                  ///< Surface friction coefficient [0, 1]
    std::vector<CollidableId> obstacles;    ///< Static obstacles attached to this body
};

/// Parameters for adding a celestial body
struct CelestialDesc {
    std::string name;
    float radius = 1.0f;
    gravwell_math::Vec3 center{0.0f};
    float friction = 0.5f;
};

// =============================================================================
// Celestial Registry
// =============================================================================

/// Registration-ordered set of celestial bodies
class CelestialRegistry {
public:
    CelestialRegistry() = default;

    /// Add a body. Fails for a non-positive or non-finite radius and a non-finite center.
    [[nodiscard]] gravwell_core::Result<CelestialId> add(const CelestialDesc& desc);

    gravwell_core::Result<void> attach_obstacle(CelestialId id, CollidableId obstacle);
    void detach_obstacle(CollidableId obstacle);

    gravwell_core::Result<void> set_center(CelestialId id, const gravwell_math::Vec3& center);

    [[nodiscard]] const CelestialBody* get(CelestialId id) const;
    [[nodiscard]] const CelestialBody* find(const std::string& name) const;

    [[nodiscard]] std::size_t len() const noexcept { return m_bodies.size(); }
    [[nodiscard]] bool is_empty() const noexcept { return m_bodies.empty(); }
    [[nodiscard]] std::span<const CelestialBody> bodies() const noexcept { return m_bodies; }

    void clear();

    /// Body with the smallest distance / radius ratio. Ties keep the earliest
    /// registered body. An empty registry yields the fallback body.
    [[nodiscard]] const CelestialBody& resolve_soi(const gravwell_math::Vec3& position) const;

    /// Radius 1 at the origin, no friction, invalid id
    [[nodiscard]] static const CelestialBody& fallback_body();

    /// Transform on (or above) the surface at latitude/longitude in degrees,
    /// oriented with local +Y along the surface normal
    [[nodiscard]] static gravwell_math::Transform surface_point(const CelestialBody& body,
                                                               float latitude_deg,
                                                               float longitude_deg,
                                                               float height = 0.0f);

private:
    std::vector<CelestialBody> m_bodies;
    mutable bool m_warned_empty = false;
};

} // namespace gravwell_physics
