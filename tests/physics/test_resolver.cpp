// gravwell_physics collision resolver tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <gravwell/physics/collision_registry.hpp>
#include <gravwell/physics/collision_resolver.hpp>

#include <vector>

using namespace gravwell_physics;
using gravwell_math::LocalBox;
using gravwell_math::OrientedBox;
using gravwell_math::Transform;
using gravwell_math::Vec3;
using Catch::Matchers::WithinAbs;

namespace {

/// Resolver with a wide static platform whose top face lies at y = 0
struct ResolverFixture {
    PhysicsConfig config = PhysicsConfig::defaults();
    CollisionRegistry registry;
    CollisionResolver resolver{config};
    CollidableId platform;

    ResolverFixture() {
        platform = registry.register_collidable(Transform::from_position(Vec3(0.0f, -0.5f, 0.0f)),
                                                LocalBox{Vec3(0.0f), Vec3(20.0f, 0.5f, 20.0f)},
                                                ObstacleCollider{}, true);
    }

    std::vector<CollidableId> candidates() const { return registry.ids(); }

    static KinematicState cube_at(const Vec3& position, const Vec3& half = Vec3(0.5f)) {
        KinematicState state;
        state.position = position;
        state.box = OrientedBox{position, half, gravwell_math::mat3::IDENTITY};
        return state;
    }
};

ResolveParams params_for(float dt, bool was_grounded = false) {
    ResolveParams params;
    params.dt = dt;
    params.up = gravwell_math::vec3::UP;
    params.was_grounded = was_grounded;
    return params;
}

} // anonymous namespace

// =============================================================================
// Classification
// =============================================================================

TEST_CASE("Contacts are classified by normal . up", "[physics][resolver]") {
    PhysicsConfig config;
    CollisionResolver resolver(config);
    const Vec3 up(0.0f, 1.0f, 0.0f);

    REQUIRE(resolver.classify(Vec3(0.0f, 1.0f, 0.0f), up) == ContactClass::Ground);
    REQUIRE(resolver.classify(Vec3(0.0f, -1.0f, 0.0f), up) == ContactClass::Ceiling);
    REQUIRE(resolver.classify(Vec3(1.0f, 0.0f, 0.0f), up) == ContactClass::Lateral);
    REQUIRE(resolver.classify(gravwell_math::normalize(Vec3(1.0f, 1.0f, 0.0f)), up) == ContactClass::Ground);
    REQUIRE(resolver.classify(Vec3(0.8f, 0.6f, 0.0f), up) == ContactClass::Lateral);
    REQUIRE(resolver.classify(Vec3(0.8f, -0.6f, 0.0f), up) == ContactClass::Ceiling);
}

// =============================================================================
// Detection
// =============================================================================

TEST_CASE("Swept static contact reports the time of impact", "[physics][resolver]") {
    ResolverFixture fx;

    SweepQuery query;
    query.box = OrientedBox{Vec3(0.0f, 1.2f, 0.0f), Vec3(0.5f), gravwell_math::mat3::IDENTITY};
    query.velocity = Vec3(0.0f, -30.0f, 0.0f);
    query.dt = 0.1f;

    auto contact = fx.resolver.detect(query, fx.candidates(), fx.registry);

    REQUIRE(contact.has_value());
    REQUIRE(contact->collidable == fx.platform);
    REQUIRE(contact->struck_static);
    REQUIRE(contact->classification == ContactClass::Ground);
    REQUIRE(gravwell_math::approx_equal(contact->normal, gravwell_math::vec3::Y, 1e-4f));
    // Bottom face reaches y = 0 after 0.7 / 3 of the motion
    REQUIRE_THAT(contact->toi_fraction, WithinAbs(0.7f / 3.0f, 0.01f));
    REQUIRE_THAT(contact->time_of_impact, WithinAbs(contact->toi_fraction * 0.1f, 1e-6f));
}

TEST_CASE("Detection ignores self and inactive collidables", "[physics][resolver]") {
    ResolverFixture fx;

    SweepQuery query;
    query.box = OrientedBox{Vec3(0.0f, 0.2f, 0.0f), Vec3(0.5f), gravwell_math::mat3::IDENTITY};
    query.dt = 0.1f;

    SECTION("self") {
        query.self = fx.platform;
        REQUIRE_FALSE(fx.resolver.detect(query, fx.candidates(), fx.registry).has_value());
    }

    SECTION("inactive") {
        REQUIRE(fx.registry.set_active(fx.platform, false).is_ok());
        REQUIRE_FALSE(fx.resolver.detect(query, fx.candidates(), fx.registry).has_value());
    }

    SECTION("missed entirely") {
        query.box.center = Vec3(0.0f, 5.0f, 0.0f);
        query.velocity = Vec3(10.0f, 0.0f, 0.0f);
        REQUIRE_FALSE(fx.resolver.detect(query, fx.candidates(), fx.registry).has_value());
    }
}

TEST_CASE("Static contacts precede non-static ones", "[physics][resolver]") {
    ResolverFixture fx;
    auto prop = fx.registry.register_collidable(Transform::from_position(Vec3(0.0f, 0.5f, 0.0f)),
                                                LocalBox{Vec3(0.0f), Vec3(0.5f)}, PropCollider{}, false);

    SweepQuery query;
    query.box = OrientedBox{Vec3(0.0f, 0.3f, 0.0f), Vec3(0.4f), gravwell_math::mat3::IDENTITY};
    query.dt = 0.1f;

    // Prop registered after the platform, listed first
    const std::vector<CollidableId> candidates{prop, fx.platform};
    auto contact = fx.resolver.detect(query, candidates, fx.registry);

    REQUIRE(contact.has_value());
    REQUIRE(contact->collidable == fx.platform);
}

// =============================================================================
// Response
// =============================================================================

TEST_CASE("Landing on a platform leaves no penetration", "[physics][resolver]") {
    ResolverFixture fx;
    KinematicState state = ResolverFixture::cube_at(Vec3(0.0f, 1.2f, 0.0f));
    state.velocity = Vec3(2.0f, -30.0f, 0.0f);

    auto contact = fx.resolver.resolve(state, params_for(0.1f), fx.candidates(), fx.registry);

    REQUIRE(contact.has_value());
    REQUIRE(contact->classification == ContactClass::Ground);
    REQUIRE_THAT(state.velocity.y, WithinAbs(0.0f, 1e-4f));
    REQUIRE_THAT(state.velocity.x, WithinAbs(2.0f, 1e-4f));
    REQUIRE(state.box.center == state.position);

    const auto after = gravwell_math::intersect(state.box, fx.registry.get(fx.platform)->box);
    REQUIRE(after.separation >= -0.01f);
    REQUIRE(state.position.y >= 0.5f - 0.01f);
}

TEST_CASE("Starting overlap is pushed out with the safety buffer", "[physics][resolver]") {
    ResolverFixture fx;
    KinematicState state = ResolverFixture::cube_at(Vec3(0.0f, 0.4f, 0.0f));

    auto contact = fx.resolver.resolve(state, params_for(0.1f), fx.candidates(), fx.registry);

    REQUIRE(contact.has_value());
    REQUIRE(contact->time_of_impact == 0.0f);
    REQUIRE_THAT(contact->penetration, WithinAbs(0.1f, 1e-4f));
    REQUIRE_THAT(state.position.y, WithinAbs(0.4f + 0.1f + fx.config.safety_buffer, 1e-4f));
    REQUIRE_FALSE(gravwell_math::intersect(state.box, fx.registry.get(fx.platform)->box));
}

TEST_CASE("Lateral contacts slide with friction", "[physics][resolver]") {
    ResolverFixture fx;
    fx.registry.clear();
    auto wall = fx.registry.register_collidable(Transform::from_position(Vec3(5.0f, 0.0f, 0.0f)),
                                                LocalBox{Vec3(0.0f), Vec3(0.5f, 10.0f, 10.0f)},
                                                ObstacleCollider{}, true);

    KinematicState state = ResolverFixture::cube_at(Vec3(4.3f, 0.0f, 0.0f));

    SECTION("airborne") {
        state.velocity = Vec3(10.0f, 3.0f, 5.0f);
        auto contact = fx.resolver.resolve(state, params_for(0.1f), fx.candidates(), fx.registry);

        REQUIRE(contact.has_value());
        REQUIRE(contact->collidable == wall);
        REQUIRE(contact->classification == ContactClass::Lateral);
        REQUIRE(gravwell_math::approx_equal(contact->normal, Vec3(-1.0f, 0.0f, 0.0f), 1e-4f));

        // Into-wall speed removed, tangential speed scaled by slide_friction
        REQUIRE_THAT(state.velocity.x, WithinAbs(0.0f, 1e-4f));
        REQUIRE_THAT(state.velocity.z, WithinAbs(5.0f * fx.config.slide_friction, 1e-4f));
        REQUIRE_THAT(state.velocity.y, WithinAbs(3.0f * fx.config.slide_friction, 1e-4f));
        REQUIRE(state.position.x <= 4.0f - fx.config.safety_buffer + 1e-4f);
    }

    SECTION("grounded keeps the up component") {
        state.velocity = Vec3(10.0f, 3.0f, 5.0f);
        auto contact = fx.resolver.resolve(state, params_for(0.1f, true), fx.candidates(), fx.registry);

        REQUIRE(contact.has_value());
        REQUIRE_THAT(state.velocity.y, WithinAbs(3.0f, 1e-4f));
        REQUIRE_THAT(state.position.y, WithinAbs(0.0f, 1e-4f));
        REQUIRE_FALSE(gravwell_math::intersect(state.box, fx.registry.get(wall)->box));
    }
}

TEST_CASE("Ceiling contacts stop upward motion", "[physics][resolver]") {
    ResolverFixture fx;
    fx.registry.clear();
    (void)fx.registry.register_collidable(Transform::from_position(Vec3(0.0f, 3.0f, 0.0f)),
                                          LocalBox{Vec3(0.0f), Vec3(20.0f, 0.5f, 20.0f)},
                                          ObstacleCollider{}, true);

    KinematicState state = ResolverFixture::cube_at(Vec3(0.0f, 2.1f, 0.0f));
    state.velocity = Vec3(1.0f, 4.0f, 0.0f);

    auto contact = fx.resolver.resolve(state, params_for(0.1f), fx.candidates(), fx.registry);

    REQUIRE(contact.has_value());
    REQUIRE(contact->classification == ContactClass::Ceiling);
    REQUIRE_THAT(state.velocity.y, WithinAbs(0.0f, 1e-4f));
    REQUIRE_THAT(state.velocity.x, WithinAbs(1.0f, 1e-4f));
    REQUIRE(state.position.y < 2.0f);

    SECTION("grounded bodies still treat boxes above them as ceilings") {
        KinematicState grounded = ResolverFixture::cube_at(Vec3(0.0f, 2.1f, 0.0f));
        grounded.velocity = Vec3(1.0f, 4.0f, 0.0f);
        auto hit = fx.resolver.resolve(grounded, params_for(0.1f, true), fx.candidates(), fx.registry);

        REQUIRE(hit.has_value());
        REQUIRE(hit->classification == ContactClass::Ceiling);
    }
}

TEST_CASE("Grounded bodies are stopped by the side of a low obstacle", "[physics][resolver]") {
    // Surface at y = 0; the body box reaches 0.6 below it like a grounded player
    ResolverFixture fx;
    fx.registry.clear();
    auto crate = fx.registry.register_collidable(Transform::from_position(Vec3(2.9f, 0.3f, 0.0f)),
                                                 LocalBox{Vec3(0.0f), Vec3(2.0f, 0.3f, 2.0f)},
                                                 ObstacleCollider{}, true);

    KinematicState state = ResolverFixture::cube_at(Vec3(-0.1f, 0.5f, 0.0f), Vec3(0.9f, 1.1f, 0.9f));
    state.velocity = Vec3(5.0f, 0.0f, 0.0f);

    auto contact = fx.resolver.resolve(state, params_for(0.1f, true), fx.candidates(), fx.registry);

    REQUIRE(contact.has_value());
    REQUIRE(contact->collidable == crate);
    REQUIRE(contact->classification == ContactClass::Lateral);
    REQUIRE(gravwell_math::approx_equal(contact->normal, Vec3(-1.0f, 0.0f, 0.0f), 1e-4f));

    REQUIRE_THAT(state.velocity.x, WithinAbs(0.0f, 1e-4f));
    REQUIRE_THAT(state.position.y, WithinAbs(0.5f, 1e-4f));
    REQUIRE(state.position.x <= 0.0f);
    REQUIRE_FALSE(gravwell_math::intersect(state.box, fx.registry.get(crate)->box));
}

TEST_CASE("Dynamic partners exchange momentum", "[physics][resolver]") {
    PhysicsConfig config;
    CollisionResolver resolver(config);
    CollisionRegistry registry;

    const BodyId other_body = BodyId::create(1, 0);
    KinematicState other = ResolverFixture::cube_at(Vec3(1.9f, 0.0f, 0.0f), Vec3(1.0f, 2.0f, 2.0f));
    auto other_id = registry.register_collidable(Transform::from_position(other.position),
                                                 LocalBox{Vec3(0.0f), Vec3(1.0f, 2.0f, 2.0f)},
                                                 VehicleCollider{other_body}, false);

    KinematicState state = ResolverFixture::cube_at(Vec3(0.0f), Vec3(1.0f, 0.5f, 0.5f));
    state.velocity = Vec3(10.0f, 0.0f, 0.0f);

    ResolveParams params = params_for(0.1f);
    params.mass = 1000.0f;
    params.restitution = 0.2f;

    bool looked_up = false;
    PartnerLookup partners = [&](const Contact& contact) -> std::optional<ImpulsePartner> {
        looked_up = true;
        REQUIRE(contact.collidable == other_id);
        return ImpulsePartner{&other, 1000.0f};
    };

    const std::vector<CollidableId> candidates{other_id};
    auto contact = resolver.resolve(state, params, candidates, registry, partners);

    REQUIRE(contact.has_value());
    REQUIRE(looked_up);
    REQUIRE(contact->classification == ContactClass::Lateral);
    REQUIRE(contact->struck_type == CollidableType::Vehicle);

    // Equal masses, restitution 0.2: 10 -> (4, 6)
    REQUIRE_THAT(state.velocity.x, WithinAbs(4.0f, 1e-3f));
    REQUIRE_THAT(other.velocity.x, WithinAbs(6.0f, 1e-3f));
    REQUIRE_THAT(state.velocity.x + other.velocity.x, WithinAbs(10.0f, 1e-3f));

    // Separation split evenly
    REQUIRE_THAT(state.position.x, WithinAbs(-0.06f, 1e-4f));
    REQUIRE_THAT(other.position.x, WithinAbs(1.96f, 1e-4f));
    REQUIRE_FALSE(gravwell_math::intersect(state.box, other.box));
}

TEST_CASE("Impulse with zero masses treats both as unit mass", "[physics][resolver]") {
    PhysicsConfig config;
    CollisionResolver resolver(config);

    KinematicState a = ResolverFixture::cube_at(Vec3(0.0f));
    KinematicState b = ResolverFixture::cube_at(Vec3(0.9f, 0.0f, 0.0f));
    a.velocity = Vec3(2.0f, 0.0f, 0.0f);

    Contact contact;
    contact.normal = Vec3(-1.0f, 0.0f, 0.0f);
    resolver.respond_impulse(a, 0.0f, b, 0.0f, contact, 0.0f);

    REQUIRE_THAT(a.velocity.x, WithinAbs(1.0f, 1e-4f));
    REQUIRE_THAT(b.velocity.x, WithinAbs(1.0f, 1e-4f));
    REQUIRE_THAT(contact.penetration, WithinAbs(0.1f, 1e-4f));
}
