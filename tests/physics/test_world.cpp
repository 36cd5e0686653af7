// gravwell_physics world simulation tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <gravwell/physics/physics.hpp>
#include <gravwell/math/intersect.hpp>

#include <cmath>
#include <limits>

using namespace gravwell_physics;
using gravwell_math::Vec3;
using Catch::Matchers::WithinAbs;

namespace {

constexpr float DT = 1.0f / 60.0f;

/// World with one planet of radius 200 at the origin
struct WorldFixture {
    World world;
    CelestialId terra;

    WorldFixture() {
        terra = *world.add_celestial({"terra", 200.0f, Vec3(0.0f), 0.5f});
    }

    /// Step until the body stops falling
    /// @return Ticks taken, or -1 when it never lands
    int run_until_supported(BodyId id, int max_ticks = 3000) {
        for (int i = 1; i <= max_ticks; ++i) {
            world.step(DT);
            if (!world.is_falling(id)) {
                return i;
            }
        }
        return -1;
    }
};

bool exactly_one_state(const World& world, BodyId id) {
    const int count = (world.is_falling(id) ? 1 : 0) + (world.is_grounded(id) ? 1 : 0) +
                      (world.is_standing_on_object(id) ? 1 : 0);
    return count == 1;
}

} // anonymous namespace

// =============================================================================
// Falling and Landing
// =============================================================================

TEST_CASE("A dropped player comes to rest on the surface shell", "[physics][world]") {
    WorldFixture fx;
    PlayerDesc desc;
    desc.position = Vec3(0.0f, 600.0f, 0.0f);
    BodyId player = fx.world.spawn_player(desc);

    REQUIRE(fx.world.is_falling(player));
    REQUIRE(fx.run_until_supported(player) > 0);

    REQUIRE(fx.world.is_grounded(player));
    REQUIRE_THAT(gravwell_math::length(*fx.world.position(player)), WithinAbs(200.5f, 1e-3f));

    for (int i = 0; i < 60; ++i) {
        fx.world.step(DT);
    }
    REQUIRE(fx.world.is_grounded(player));
    REQUIRE_THAT(gravwell_math::length(*fx.world.position(player)), WithinAbs(200.5f, 1e-3f));
    REQUIRE_THAT(gravwell_math::length(*fx.world.velocity(player)), WithinAbs(0.0f, 1e-3f));
}

TEST_CASE("Exactly one motion state holds after every tick", "[physics][world]") {
    WorldFixture fx;
    PlayerDesc desc;
    desc.position = Vec3(0.0f, 260.0f, 0.0f);
    BodyId player = fx.world.spawn_player(desc);

    for (int i = 0; i < 600; ++i) {
        fx.world.step(DT);
        REQUIRE(exactly_one_state(fx.world, player));
        REQUIRE(fx.world.surface_normal(player).has_value() == !fx.world.is_falling(player));

        if (i == 300) {
            REQUIRE(fx.world.add_velocity(player, Vec3(0.0f, 20.0f, 0.0f)).is_ok());
        }
    }
}

TEST_CASE("Landing and liftoff fire once per transition", "[physics][world]") {
    WorldFixture fx;
    PlayerDesc desc;
    desc.position = Vec3(0.0f, 230.0f, 0.0f);
    BodyId player = fx.world.spawn_player(desc);

    int landings = 0;
    int liftoffs = 0;
    Vec3 landing_normal(0.0f);
    REQUIRE(fx.world.on_landing(player, [&](BodyId id, const Vec3& n) {
        REQUIRE(id == player);
        landing_normal = n;
        ++landings;
    }).is_ok());
    REQUIRE(fx.world.on_liftoff(player, [&](BodyId, const Vec3&) { ++liftoffs; }).is_ok());

    REQUIRE(fx.run_until_supported(player) > 0);
    REQUIRE(landings == 1);
    REQUIRE(liftoffs == 0);
    REQUIRE(gravwell_math::approx_equal(landing_normal, gravwell_math::vec3::Y, 1e-3f));
    REQUIRE(fx.world.stats().landings == 1);

    for (int i = 0; i < 10; ++i) {
        fx.world.step(DT);
    }
    REQUIRE(landings == 1);
    REQUIRE(liftoffs == 0);

    // Jump
    REQUIRE(fx.world.add_velocity(player, Vec3(0.0f, 20.0f, 0.0f)).is_ok());
    fx.world.step(DT);
    REQUIRE(fx.world.is_falling(player));
    REQUIRE(liftoffs == 1);
    REQUIRE(fx.world.stats().liftoffs == 1);

    REQUIRE(fx.run_until_supported(player) > 0);
    REQUIRE(landings == 2);
    REQUIRE(liftoffs == 1);
}

TEST_CASE("Players do not align while falling and snap on landing", "[physics][world]") {
    WorldFixture fx;
    PlayerDesc desc;
    desc.position = Vec3(400.0f, 0.0f, 0.0f);
    BodyId player = fx.world.spawn_player(desc);

    fx.world.step(DT);
    REQUIRE(fx.world.is_falling(player));
    REQUIRE(gravwell_math::approx_equal(*fx.world.orientation(player), gravwell_math::quat::IDENTITY, 1e-6f));

    REQUIRE(fx.run_until_supported(player) > 0);
    const Vec3 up = gravwell_math::rotate(*fx.world.orientation(player), gravwell_math::vec3::UP);
    REQUIRE(gravwell_math::approx_equal(up, gravwell_math::vec3::X, 1e-3f));
}

// =============================================================================
// Obstacles
// =============================================================================

TEST_CASE("A player lands on an obstacle and stays on it", "[physics][world]") {
    WorldFixture fx;

    ObstacleDesc platform;
    platform.name = "platform";
    platform.transform = gravwell_math::Transform::from_position(Vec3(0.0f, 205.0f, 0.0f));
    platform.box = gravwell_math::LocalBox{Vec3(0.0f), Vec3(10.0f, 0.5f, 10.0f)};
    platform.anchor = fx.terra;
    CollidableId platform_id = fx.world.add_obstacle(platform);
    REQUIRE(fx.world.celestials().get(fx.terra)->obstacles.size() == 1);

    PlayerDesc desc;
    desc.position = Vec3(0.0f, 215.0f, 0.0f);
    BodyId player = fx.world.spawn_player(desc);

    int contacts = 0;
    fx.world.on_contact([&](BodyId, const Contact& contact) {
        if (contact.collidable == platform_id) {
            ++contacts;
        }
    });

    REQUIRE(fx.run_until_supported(player) > 0);
    REQUIRE(fx.world.is_standing_on_object(player));
    REQUIRE(fx.world.body(player)->support == platform_id);
    REQUIRE(contacts >= 1);
    REQUIRE(gravwell_math::approx_equal(*fx.world.surface_normal(player), gravwell_math::vec3::Y, 1e-3f));

    // Bottom of the player box rests on the platform top
    const float bottom = fx.world.position(player)->y - 1.1f;
    REQUIRE_THAT(bottom, WithinAbs(205.5f, 0.05f));

    for (int i = 0; i < 120; ++i) {
        fx.world.step(DT);
        REQUIRE(fx.world.is_standing_on_object(player));
    }
    REQUIRE(fx.world.position(player)->y - 1.1f >= 205.5f - 0.01f);
}

TEST_CASE("Removing the support makes the player fall", "[physics][world]") {
    WorldFixture fx;

    ObstacleDesc platform;
    platform.transform = gravwell_math::Transform::from_position(Vec3(0.0f, 205.0f, 0.0f));
    platform.box = gravwell_math::LocalBox{Vec3(0.0f), Vec3(10.0f, 0.5f, 10.0f)};
    platform.anchor = fx.terra;
    CollidableId platform_id = fx.world.add_obstacle(platform);

    PlayerDesc desc;
    desc.position = Vec3(0.0f, 210.0f, 0.0f);
    BodyId player = fx.world.spawn_player(desc);
    REQUIRE(fx.run_until_supported(player) > 0);
    REQUIRE(fx.world.is_standing_on_object(player));

    REQUIRE(fx.world.unregister_collidable(platform_id).is_ok());
    REQUIRE(fx.world.celestials().get(fx.terra)->obstacles.empty());

    fx.world.step(DT);
    REQUIRE(fx.world.is_falling(player));

    REQUIRE(fx.run_until_supported(player) > 0);
    REQUIRE(fx.world.is_grounded(player));
}

TEST_CASE("Obstacles anchored elsewhere are ignored", "[physics][world]") {
    WorldFixture fx;
    auto luna = fx.world.add_celestial({"luna", 50.0f, Vec3(1000.0f, 0.0f, 0.0f), 0.5f});
    REQUIRE(luna.is_ok());

    ObstacleDesc platform;
    platform.transform = gravwell_math::Transform::from_position(Vec3(0.0f, 205.0f, 0.0f));
    platform.box = gravwell_math::LocalBox{Vec3(0.0f), Vec3(10.0f, 0.5f, 10.0f)};
    platform.anchor = *luna;
    (void)fx.world.add_obstacle(platform);

    PlayerDesc desc;
    desc.position = Vec3(0.0f, 210.0f, 0.0f);
    BodyId player = fx.world.spawn_player(desc);

    REQUIRE(fx.run_until_supported(player) > 0);
    REQUIRE(fx.world.is_grounded(player));
}

TEST_CASE("A grounded player cannot walk through a low obstacle", "[physics][world]") {
    WorldFixture fx;

    // Lower than the part of the player box above the surface
    ObstacleDesc crate;
    crate.name = "crate";
    crate.transform = gravwell_math::Transform::from_position(Vec3(2.9f, 200.3f, 0.0f));
    crate.box = gravwell_math::LocalBox{Vec3(0.0f), Vec3(2.0f, 0.3f, 2.0f)};
    crate.anchor = fx.terra;
    const CollidableId crate_id = fx.world.add_obstacle(crate);

    PlayerDesc desc;
    desc.position = Vec3(-3.0f, 200.5f, 0.0f);
    BodyId player = fx.world.spawn_player(desc);
    REQUIRE(fx.run_until_supported(player) > 0);
    REQUIRE(fx.world.is_grounded(player));

    const gravwell_math::OrientedBox crate_box = fx.world.collidables().get(crate_id)->box;
    int contacts = 0;
    fx.world.on_contact([&](BodyId, const Contact& contact) {
        if (contact.collidable == crate_id) {
            ++contacts;
        }
    });

    for (int i = 0; i < 180; ++i) {
        REQUIRE(fx.world.set_velocity(player, Vec3(5.0f, 0.0f, 0.0f)).is_ok());
        fx.world.step(DT);

        const auto hit = gravwell_math::intersect(fx.world.body(player)->box(), crate_box);
        REQUIRE(hit.penetration() <= 0.01f);
        REQUIRE(fx.world.is_grounded(player));
    }

    REQUIRE(contacts > 0);
    REQUIRE(fx.world.position(player)->x < 0.1f);
    REQUIRE_THAT(gravwell_math::length(*fx.world.position(player)), WithinAbs(200.5f, 1e-3f));
}

TEST_CASE("Body collidables cannot be unregistered directly", "[physics][world]") {
    WorldFixture fx;
    BodyId player = fx.world.spawn_player(PlayerDesc{});
    const CollidableId own = fx.world.body(player)->collidable;

    REQUIRE(fx.world.unregister_collidable(own).is_err());
    REQUIRE(fx.world.collidables().contains(own));
}

// =============================================================================
// Sphere of Influence
// =============================================================================

TEST_CASE("Bodies track their sphere of influence", "[physics][world]") {
    WorldFixture fx;
    auto luna = fx.world.add_celestial({"luna", 50.0f, Vec3(1000.0f, 0.0f, 0.0f), 0.5f});

    PlayerDesc near_terra;
    near_terra.position = Vec3(700.0f, 0.0f, 0.0f);
    PlayerDesc near_luna;
    near_luna.position = Vec3(900.0f, 0.0f, 0.0f);

    BodyId a = fx.world.spawn_player(near_terra);
    BodyId b = fx.world.spawn_player(near_luna);

    REQUIRE(*fx.world.soi_of(a) == fx.terra);
    REQUIRE(*fx.world.soi_of(b) == *luna);

    fx.world.step(DT);
    // Pulled toward luna, away from terra
    REQUIRE(fx.world.velocity(b)->x > 0.0f);
    REQUIRE(fx.world.velocity(a)->x < 0.0f);
}

// =============================================================================
// Vehicles
// =============================================================================

TEST_CASE("Parked vehicles are damped", "[physics][world]") {
    WorldFixture fx;
    VehicleDesc desc;
    desc.position = Vec3(0.0f, 202.9f, 0.0f);
    desc.velocity = Vec3(0.4f, 0.0f, 0.0f);
    BodyId car = fx.world.spawn_vehicle(desc);

    SECTION("unoccupied") {
        fx.world.step(DT);
        REQUIRE(fx.world.is_grounded(car));
        REQUIRE(gravwell_math::length(*fx.world.velocity(car)) < 0.4f * 0.2f + 1e-3f);
    }

    SECTION("occupied") {
        REQUIRE(fx.world.set_occupied(car, true).is_ok());
        fx.world.step(DT);
        REQUIRE(fx.world.is_grounded(car));
        REQUIRE(gravwell_math::length(*fx.world.velocity(car)) > 0.39f);
    }

    SECTION("players cannot be occupied") {
        BodyId player = fx.world.spawn_player(PlayerDesc{});
        REQUIRE(fx.world.set_occupied(player, true).is_err());
    }
}

TEST_CASE("Vehicles align to the surface and keep their heading", "[physics][world]") {
    WorldFixture fx;
    VehicleDesc desc;
    desc.position = Vec3(202.9f, 0.0f, 0.0f);
    BodyId car = fx.world.spawn_vehicle(desc);

    for (int i = 0; i < 120; ++i) {
        fx.world.step(DT);
    }

    REQUIRE(fx.world.is_grounded(car));
    const auto orientation = *fx.world.orientation(car);
    REQUIRE(gravwell_math::approx_equal(gravwell_math::rotate(orientation, gravwell_math::vec3::UP),
                                        gravwell_math::vec3::X, 1e-3f));
    REQUIRE(gravwell_math::approx_equal(gravwell_math::rotate(orientation, gravwell_math::vec3::FORWARD),
                                        gravwell_math::vec3::NEG_Z, 1e-3f));
    REQUIRE_THAT(gravwell_math::length(*fx.world.position(car)), WithinAbs(203.0f, 1e-3f));
}

// =============================================================================
// Lifecycle and Control
// =============================================================================

TEST_CASE("Despawn removes the body and its collidable", "[physics][world]") {
    WorldFixture fx;
    BodyId a = fx.world.spawn_player(PlayerDesc{});
    BodyId b = fx.world.spawn_vehicle(VehicleDesc{});
    REQUIRE(fx.world.body_count() == 2);
    REQUIRE(fx.world.collidables().len() == 2);

    REQUIRE(fx.world.despawn(a).is_ok());
    REQUIRE(fx.world.body_count() == 1);
    REQUIRE(fx.world.collidables().len() == 1);
    REQUIRE(fx.world.bodies() == std::vector<BodyId>{b});
    REQUIRE_FALSE(fx.world.position(a).has_value());
    REQUIRE_FALSE(fx.world.is_falling(a));

    auto again = fx.world.despawn(a);
    REQUIRE(again.is_err());
    REQUIRE(again.error().code() == gravwell_core::ErrorCode::NotFound);

    fx.world.step(DT);
    REQUIRE(fx.world.stats().bodies_stepped == 1);
}

TEST_CASE("Callbacks cannot spawn or despawn during a step", "[physics][world]") {
    WorldFixture fx;
    PlayerDesc desc;
    desc.position = Vec3(0.0f, 230.0f, 0.0f);
    BodyId player = fx.world.spawn_player(desc);

    bool fired = false;
    bool stepping = false;
    bool despawn_refused = false;
    bool spawn_refused = false;
    REQUIRE(fx.world.on_landing(player, [&](BodyId id, const Vec3&) {
        fired = true;
        stepping = fx.world.is_stepping();
        despawn_refused = fx.world.despawn(id).is_err();
        spawn_refused = fx.world.spawn_vehicle(VehicleDesc{}).is_null();
    }).is_ok());

    REQUIRE(fx.run_until_supported(player) > 0);
    REQUIRE(fired);
    REQUIRE(stepping);
    REQUIRE(despawn_refused);
    REQUIRE(spawn_refused);

    REQUIRE_FALSE(fx.world.is_stepping());
    REQUIRE(fx.world.body_count() == 1);
    REQUIRE(fx.world.collidables().len() == 1);
    REQUIRE(fx.world.is_grounded(player));

    fx.world.step(DT);
    REQUIRE(fx.world.despawn(player).is_ok());
    REQUIRE(fx.world.body_count() == 0);
}

TEST_CASE("Invalid time steps are ignored", "[physics][world]") {
    WorldFixture fx;
    PlayerDesc desc;
    desc.position = Vec3(0.0f, 300.0f, 0.0f);
    BodyId player = fx.world.spawn_player(desc);

    fx.world.step(0.0f);
    fx.world.step(-1.0f);
    fx.world.step(std::numeric_limits<float>::quiet_NaN());
    fx.world.step(std::numeric_limits<float>::infinity());

    REQUIRE(fx.world.stats().ticks == 0);
    REQUIRE(*fx.world.position(player) == Vec3(0.0f, 300.0f, 0.0f));
    REQUIRE(*fx.world.velocity(player) == Vec3(0.0f));
}

TEST_CASE("Snapshots round through apply_snapshot", "[physics][world]") {
    WorldFixture fx;
    PlayerDesc desc;
    desc.position = Vec3(0.0f, 300.0f, 0.0f);
    BodyId player = fx.world.spawn_player(desc);

    BodySnapshot snapshot;
    snapshot.position = Vec3(5.0f, 250.0f, 0.0f);
    snapshot.velocity = Vec3(1.0f, 0.0f, 0.0f);
    snapshot.orientation = gravwell_math::quat_from_axis_angle(gravwell_math::vec3::Z, 0.5f);

    REQUIRE(fx.world.apply_snapshot(player, snapshot).is_ok());
    auto read = fx.world.snapshot(player);
    REQUIRE(read.is_ok());
    REQUIRE(read->position == snapshot.position);
    REQUIRE(read->velocity == snapshot.velocity);
    REQUIRE(gravwell_math::approx_equal(read->orientation, snapshot.orientation, 1e-5f));

    // Collidable follows immediately
    const Collidable* own = fx.world.collidables().get(fx.world.body(player)->collidable);
    REQUIRE(own->box.center == snapshot.position);

    SECTION("degenerate values keep the last valid pose") {
        BodySnapshot bad;
        bad.position = Vec3(std::numeric_limits<float>::quiet_NaN());
        bad.velocity = Vec3(std::numeric_limits<float>::infinity());
        REQUIRE(fx.world.apply_snapshot(player, bad).is_ok());
        REQUIRE(*fx.world.position(player) == snapshot.position);
        REQUIRE(*fx.world.velocity(player) == Vec3(0.0f));
    }

    SECTION("unknown body") {
        REQUIRE(fx.world.snapshot(BodyId::create(99, 0)).is_err());
        REQUIRE(fx.world.apply_snapshot(BodyId::create(99, 0), snapshot).is_err());
    }
}

TEST_CASE("Velocity and rotation control", "[physics][world]") {
    WorldFixture fx;
    PlayerDesc desc;
    desc.position = Vec3(0.0f, 300.0f, 0.0f);
    BodyId player = fx.world.spawn_player(desc);

    REQUIRE(fx.world.set_velocity(player, Vec3(1.0f, 2.0f, 3.0f)).is_ok());
    REQUIRE(fx.world.add_velocity(player, Vec3(1.0f, 0.0f, 0.0f)).is_ok());
    REQUIRE(*fx.world.velocity(player) == Vec3(2.0f, 2.0f, 3.0f));

    REQUIRE(fx.world.set_velocity(player, Vec3(std::numeric_limits<float>::quiet_NaN())).is_err());
    REQUIRE(*fx.world.velocity(player) == Vec3(2.0f, 2.0f, 3.0f));

    const auto turn = gravwell_math::quat_from_axis_angle(gravwell_math::vec3::Y, 1.0f);
    REQUIRE(fx.world.rotate(player, turn).is_ok());
    REQUIRE(gravwell_math::approx_equal(*fx.world.orientation(player), turn, 1e-5f));
}

TEST_CASE("Degenerate spawns are repaired", "[physics][world]") {
    WorldFixture fx;
    PlayerDesc desc;
    desc.position = Vec3(std::numeric_limits<float>::quiet_NaN());
    desc.mass = -4.0f;
    BodyId player = fx.world.spawn_player(desc);

    REQUIRE(gravwell_math::is_finite(*fx.world.position(player)));
    REQUIRE(fx.world.body(player)->mass > 0.0f);

    fx.world.step(DT);
    REQUIRE(gravwell_math::is_finite(*fx.world.position(player)));
}

TEST_CASE("Invalid masses fall back to the configured defaults", "[physics][world]") {
    PhysicsConfig config;
    config.player_mass = 85.0f;
    config.vehicle_mass = 1400.0f;
    World world(config);

    PlayerDesc player;
    player.mass = -4.0f;
    VehicleDesc vehicle;
    vehicle.mass = std::numeric_limits<float>::quiet_NaN();

    REQUIRE(world.body(world.spawn_player(player))->mass == 85.0f);
    REQUIRE(world.body(world.spawn_vehicle(vehicle))->mass == 1400.0f);
}

TEST_CASE("Sanitizing restores the last valid mass", "[physics][world]") {
    DynamicBody body;
    body.kind = VehicleParams{};
    body.mass = 1234.0f;
    body.remember_valid();

    body.mass = std::numeric_limits<float>::quiet_NaN();
    REQUIRE(body.sanitize());
    REQUIRE(body.mass == 1234.0f);

    DynamicBody fresh;
    fresh.mass = 0.0f;
    REQUIRE(fresh.sanitize());
    REQUIRE(fresh.mass == 1.0f);
}

TEST_CASE("Totals accumulate while stats hold the last tick", "[physics][world]") {
    WorldFixture fx;
    PlayerDesc desc;
    desc.position = Vec3(0.0f, 300.0f, 0.0f);
    BodyId player = fx.world.spawn_player(desc);

    BodySnapshot bad;
    bad.position = Vec3(std::numeric_limits<float>::quiet_NaN());
    REQUIRE(fx.world.apply_snapshot(player, bad).is_ok());
    REQUIRE(fx.world.stats().degenerate_recoveries == 1);
    REQUIRE(fx.world.totals().degenerate_recoveries == 1);

    for (int i = 0; i < 3; ++i) {
        fx.world.step(DT);
    }

    REQUIRE(fx.world.stats().ticks == 3);
    REQUIRE(fx.world.stats().bodies_stepped == 1);
    REQUIRE(fx.world.stats().degenerate_recoveries == 0);

    REQUIRE(fx.world.totals().ticks == 3);
    REQUIRE(fx.world.totals().bodies_stepped == 3);
    REQUIRE(fx.world.totals().substeps >= 3);
    REQUIRE(fx.world.totals().degenerate_recoveries == 1);

    fx.world.clear();
    REQUIRE(fx.world.totals().ticks == 0);
}

TEST_CASE("Invalid configs fall back to defaults", "[physics][world]") {
    PhysicsConfig config;
    config.max_speed = -1.0f;
    World world(config);
    REQUIRE(world.config().max_speed == PhysicsConfig::defaults().max_speed);
}

TEST_CASE("A world without celestial bodies still steps", "[physics][world]") {
    World world;
    PlayerDesc desc;
    desc.position = Vec3(0.0f, 10.0f, 0.0f);
    BodyId player = world.spawn_player(desc);

    for (int i = 0; i < 10; ++i) {
        world.step(DT);
    }
    REQUIRE(gravwell_math::is_finite(*world.position(player)));
    REQUIRE(exactly_one_state(world, player));
}
