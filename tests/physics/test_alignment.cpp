// gravwell_physics surface alignment tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <gravwell/physics/alignment.hpp>

#include <gravwell/math/constants.hpp>
#include <gravwell/math/vec.hpp>

#include <cmath>

using namespace gravwell_physics;
using gravwell_math::Quat;
using gravwell_math::Vec3;
using Catch::Matchers::WithinAbs;

namespace {

Vec3 up_of(const Quat& q) {
    return gravwell_math::rotate(q, gravwell_math::vec3::UP);
}

Vec3 forward_of(const Quat& q) {
    return gravwell_math::rotate(q, gravwell_math::vec3::FORWARD);
}

} // anonymous namespace

TEST_CASE("Interpolation factor", "[physics][alignment]") {
    AlignmentOptions options;

    SECTION("rate scaled by dt") {
        options.rate = 8.0f;
        options.dt = 1.0f / 60.0f;
        REQUIRE_THAT(SurfaceAligner::interpolation_factor(options),
                     WithinAbs(1.0f - std::exp(-8.0f / 60.0f), 1e-6f));
    }

    SECTION("zero dt does not rotate") {
        options.dt = 0.0f;
        REQUIRE(SurfaceAligner::interpolation_factor(options) == 0.0f);
    }

    SECTION("fixed factor overrides the rate and is clamped") {
        options.dt = 1.0f;
        options.fixed_factor = 0.3f;
        REQUIRE_THAT(SurfaceAligner::interpolation_factor(options), WithinAbs(0.3f, 1e-6f));
        options.fixed_factor = 2.0f;
        REQUIRE(SurfaceAligner::interpolation_factor(options) == 1.0f);
    }
}

TEST_CASE("Aligning to the current up is a no-op", "[physics][alignment]") {
    SurfaceAligner aligner;
    const Quat tilted = gravwell_math::quat_from_axis_angle(gravwell_math::vec3::Z, 0.4f);

    AlignmentOptions options;
    options.dt = 0.1f;
    auto result = aligner.align(tilted, up_of(tilted), options);

    REQUIRE_FALSE(result.skipped);
    REQUIRE(gravwell_math::approx_equal(result.orientation, tilted, 1e-4f));
    REQUIRE(gravwell_math::angle_between(result.applied_rotation, gravwell_math::quat::IDENTITY) < 1e-2f);
}

TEST_CASE("Full factor snaps the up axis", "[physics][alignment]") {
    SurfaceAligner aligner;

    AlignmentOptions options;
    options.fixed_factor = 1.0f;
    auto result = aligner.align(gravwell_math::quat::IDENTITY, gravwell_math::vec3::X, options);

    REQUIRE(gravwell_math::approx_equal(up_of(result.orientation), gravwell_math::vec3::X, 1e-4f));
    REQUIRE(gravwell_math::approx_equal(gravwell_math::rotate(result.applied_rotation, gravwell_math::vec3::UP),
                                        gravwell_math::vec3::X, 1e-4f));
}

TEST_CASE("Partial factor rotates part of the way", "[physics][alignment]") {
    SurfaceAligner aligner;

    AlignmentOptions options;
    options.fixed_factor = 0.5f;
    auto result = aligner.align(gravwell_math::quat::IDENTITY, gravwell_math::vec3::X, options);

    const float angle = std::acos(gravwell_math::dot(up_of(result.orientation), gravwell_math::vec3::Y));
    REQUIRE_THAT(angle, WithinAbs(gravwell_math::consts::PI / 4.0f, 1e-3f));
}

TEST_CASE("Falling bodies skip alignment unless forced", "[physics][alignment]") {
    SurfaceAligner aligner;

    AlignmentOptions options;
    options.fixed_factor = 1.0f;
    options.falling = true;

    auto skipped = aligner.align(gravwell_math::quat::IDENTITY, gravwell_math::vec3::X, options);
    REQUIRE(skipped.skipped);
    REQUIRE(skipped.orientation == gravwell_math::quat::IDENTITY);

    options.force = true;
    auto forced = aligner.align(gravwell_math::quat::IDENTITY, gravwell_math::vec3::X, options);
    REQUIRE_FALSE(forced.skipped);
    REQUIRE(gravwell_math::approx_equal(up_of(forced.orientation), gravwell_math::vec3::X, 1e-4f));
}

TEST_CASE("Degenerate targets are skipped", "[physics][alignment]") {
    SurfaceAligner aligner;
    AlignmentOptions options;
    options.fixed_factor = 1.0f;

    REQUIRE(aligner.align(gravwell_math::quat::IDENTITY, Vec3(0.0f), options).skipped);
    REQUIRE(aligner.align(gravwell_math::quat::IDENTITY, Vec3(std::nanf(""), 1.0f, 0.0f), options).skipped);
}

TEST_CASE("Preserving forward keeps the heading", "[physics][alignment]") {
    SurfaceAligner aligner;

    AlignmentOptions options;
    options.fixed_factor = 1.0f;
    options.preserve_forward = true;

    auto result = aligner.align(gravwell_math::quat::IDENTITY, gravwell_math::vec3::X, options);

    REQUIRE(gravwell_math::approx_equal(up_of(result.orientation), gravwell_math::vec3::X, 1e-4f));
    REQUIRE(gravwell_math::approx_equal(forward_of(result.orientation), gravwell_math::vec3::NEG_Z, 1e-4f));
}

TEST_CASE("Target orientation falls back when forward is parallel to up", "[physics][alignment]") {
    // Forward (-Z) projected onto a -Z up vanishes
    const Quat target = SurfaceAligner::target_orientation(gravwell_math::quat::IDENTITY,
                                                           gravwell_math::vec3::NEG_Z, true);
    REQUIRE(gravwell_math::is_finite(target));
    REQUIRE(gravwell_math::approx_equal(up_of(target), gravwell_math::vec3::NEG_Z, 1e-4f));
}
