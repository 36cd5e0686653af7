/// @file types.cpp
/// @brief Core type implementations for gravwell_physics

#include <gravwell/physics/types.hpp>

#include <type_traits>

namespace gravwell_physics {

// =============================================================================
// String Conversions
// =============================================================================

const char* to_string(MotionState state) {
    switch (state) {
        case MotionState::Falling: return "Falling";
        case MotionState::Grounded: return "Grounded";
        case MotionState::StandingOnObject: return "StandingOnObject";
    }
    return "Unknown";
}

const char* to_string(CollidableType type) {
    switch (type) {
        case CollidableType::Player: return "Player";
        case CollidableType::Vehicle: return "Vehicle";
        case CollidableType::StaticObstacle: return "StaticObstacle";
        case CollidableType::DynamicProp: return "DynamicProp";
    }
    return "Unknown";
}

const char* to_string(ContactClass cls) {
    switch (cls) {
        case ContactClass::Ground: return "Ground";
        case ContactClass::Lateral: return "Lateral";
        case ContactClass::Ceiling: return "Ceiling";
    }
    return "Unknown";
}

// =============================================================================
// Collidable Kind Queries
// =============================================================================

CollidableType type_of(const CollidableKind& kind) {
    return std::visit([](const auto& k) -> CollidableType {
        using K = std::decay_t<decltype(k)>;
        if constexpr (std::is_same_v<K, PlayerCollider>) {
            return CollidableType::Player;
        } else if constexpr (std::is_same_v<K, VehicleCollider>) {
            return CollidableType::Vehicle;
        } else if constexpr (std::is_same_v<K, ObstacleCollider>) {
            return CollidableType::StaticObstacle;
        } else {
            return CollidableType::DynamicProp;
        }
    }, kind);
}

std::optional<BodyId> owner_body(const CollidableKind& kind) {
    if (const auto* player = std::get_if<PlayerCollider>(&kind)) {
        return player->body;
    }
    if (const auto* vehicle = std::get_if<VehicleCollider>(&kind)) {
        return vehicle->body;
    }
    return std::nullopt;
}

} // namespace gravwell_physics
