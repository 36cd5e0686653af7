/// @file collision_registry.hpp
/// @brief Registry of every collidable box in the simulation

#pragma once

#include "fwd.hpp"
#include "types.hpp"

#include <gravwell/core/error.hpp>
#include <gravwell/core/handle.hpp>
#include <gravwell/math/obb.hpp>

#include <cstddef>
#include <optional>
#include <vector>

namespace gravwell_physics {

// =============================================================================
// Collidable
// =============================================================================

/// A box attached to an owner transform
struct Collidable {
    gravwell_math::Transform owner;         ///< Owner world transform
    gravwell_math::LocalBox local;          ///< Box in owner space, fixed at registration
    gravwell_math::OrientedBox box;         ///< World box from the last bounds update
    std::optional<gravwell_math::OrientedBox> last_valid;
    CollidableKind kind;
    bool is_static = false;
    bool active = true;
    bool dirty = true;                      ///< Owner moved since the last bounds update

    [[nodiscard]] CollidableType type() const { return type_of(kind); }
};

// =============================================================================
// Collision Registry
// =============================================================================

/// Handle-keyed collidable storage with registration order
class CollisionRegistry {
public:
    CollisionRegistry() = default;

    /// Register and compute the initial bounds
    [[nodiscard]] CollidableId register_collidable(const gravwell_math::Transform& owner,
                                                   const gravwell_math::LocalBox& local,
                                                   CollidableKind kind,
                                                   bool is_static);

    gravwell_core::Result<void> unregister(CollidableId id);

    /// Update the owner transform; marks the entry dirty when it changed
    gravwell_core::Result<void> set_owner_transform(CollidableId id, const gravwell_math::Transform& owner);

    /// Recompute the world box. A degenerate result keeps the last valid box
    /// (a unit box at the owner position when there is none) and reports
    /// PhysicsError::DegenerateInput.
    gravwell_core::Result<void> update_bounds(CollidableId id);

    /// Refresh every active dirty entry
    /// @return Number of entries that fell back to a previous or unit box
    std::size_t update_all();

    gravwell_core::Result<void> set_active(CollidableId id, bool active);

    [[nodiscard]] const Collidable* get(CollidableId id) const { return m_entries.get(id); }
    [[nodiscard]] bool contains(CollidableId id) const { return m_entries.contains(id); }
    [[nodiscard]] std::size_t len() const noexcept { return m_entries.len(); }
    [[nodiscard]] bool is_empty() const noexcept { return m_entries.is_empty(); }

    /// Registration-ordered ids
    [[nodiscard]] const std::vector<CollidableId>& ids() const noexcept { return m_order; }

    /// Visit live entries in registration order
    template<typename F>
    void for_each(F&& func) const {
        for (CollidableId id : m_order) {
            if (const Collidable* c = m_entries.get(id)) {
                func(id, *c);
            }
        }
    }

    /// Active entries whose bounding sphere comes within `radius` of `position`
    [[nodiscard]] std::vector<CollidableId> query_near(const gravwell_math::Vec3& position, float radius) const;

    void clear();

private:
    gravwell_core::HandleMap<Collidable> m_entries;
    std::vector<CollidableId> m_order;
};

} // namespace gravwell_physics
