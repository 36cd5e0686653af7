/// @file collision_registry.cpp
/// @brief CollisionRegistry implementation

#include <gravwell/physics/collision_registry.hpp>

#include <gravwell/core/log.hpp>

#include <algorithm>

namespace gravwell_physics {

using gravwell_core::Err;
using gravwell_core::HandleError;
using gravwell_core::Ok;
using gravwell_core::PhysicsError;

namespace {

gravwell_core::Error lookup_error(const gravwell_core::HandleMap<Collidable>& entries, CollidableId id) {
    auto result = entries.get_result(id);
    if (result) {
        return PhysicsError::missing_collidable(std::to_string(id.index()));
    }
    return result.error();
}

} // anonymous namespace

CollidableId CollisionRegistry::register_collidable(const gravwell_math::Transform& owner,
                                                    const gravwell_math::LocalBox& local,
                                                    CollidableKind kind,
                                                    bool is_static) {
    Collidable entry;
    entry.owner = owner;
    entry.local = local;
    entry.kind = std::move(kind);
    entry.is_static = is_static;

    CollidableId id = m_entries.insert(std::move(entry));
    if (id.is_null()) {
        gravwell_core::physics_logger()->error("Collidable storage exhausted");
        return id;
    }
    m_order.push_back(id);

    auto bounds = update_bounds(id);
    if (!bounds) {
        gravwell_core::physics_logger()->warn("Collidable {} registered with degenerate bounds: {}",
                                              id.index(), bounds.error().message());
    }
    return id;
}

gravwell_core::Result<void> CollisionRegistry::unregister(CollidableId id) {
    auto removed = m_entries.remove(id);
    if (!removed) {
        gravwell_core::physics_logger()->warn("Unregister of unknown collidable {}", id.index());
        return Err(HandleError::stale());
    }
    m_order.erase(std::remove(m_order.begin(), m_order.end(), id), m_order.end());
    return Ok();
}

gravwell_core::Result<void> CollisionRegistry::set_owner_transform(CollidableId id,
                                                                   const gravwell_math::Transform& owner) {
    Collidable* entry = m_entries.get_mut(id);
    if (!entry) {
        return Err(lookup_error(m_entries, id));
    }
    if (entry->owner != owner) {
        entry->owner = owner;
        entry->dirty = true;
    }
    return Ok();
}

gravwell_core::Result<void> CollisionRegistry::update_bounds(CollidableId id) {
    Collidable* entry = m_entries.get_mut(id);
    if (!entry) {
        return Err(lookup_error(m_entries, id));
    }

    entry->dirty = false;
    const auto box = gravwell_math::OrientedBox::from_transform(entry->owner, entry->local);
    if (box.is_valid()) {
        entry->box = box;
        entry->last_valid = box;
        return Ok();
    }

    if (entry->last_valid) {
        entry->box = *entry->last_valid;
    } else {
        const auto& position = entry->owner.position;
        entry->box = gravwell_math::OrientedBox::unit_at(
            gravwell_math::is_finite(position) ? position : gravwell_math::vec3::ZERO);
    }
    return Err(PhysicsError::degenerate_input("collidable bounds"));
}

std::size_t CollisionRegistry::update_all() {
    std::size_t fallbacks = 0;
    for (CollidableId id : m_order) {
        const Collidable* entry = m_entries.get(id);
        if (!entry || !entry->active || !entry->dirty) {
            continue;
        }
        auto result = update_bounds(id);
        if (!result) {
            ++fallbacks;
            gravwell_core::physics_logger()->warn("Collidable {} kept fallback bounds: {}",
                                                  id.index(), result.error().message());
        }
    }
    return fallbacks;
}

gravwell_core::Result<void> CollisionRegistry::set_active(CollidableId id, bool active) {
    Collidable* entry = m_entries.get_mut(id);
    if (!entry) {
        return Err(lookup_error(m_entries, id));
    }
    entry->active = active;
    return Ok();
}

std::vector<CollidableId> CollisionRegistry::query_near(const gravwell_math::Vec3& position,
                                                        float radius) const {
    std::vector<CollidableId> result;
    for (CollidableId id : m_order) {
        const Collidable* entry = m_entries.get(id);
        if (!entry || !entry->active) {
            continue;
        }
        const float gap = gravwell_math::distance(position, entry->box.center) - entry->box.bounding_radius();
        if (gap <= radius) {
            result.push_back(id);
        }
    }
    return result;
}

void CollisionRegistry::clear() {
    m_entries.clear();
    m_order.clear();
}

} // namespace gravwell_physics
