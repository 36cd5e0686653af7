/// @file alignment.cpp
/// @brief SurfaceAligner implementation

#include <gravwell/physics/alignment.hpp>

#include <gravwell/math/vec.hpp>

#include <algorithm>
#include <cmath>

namespace gravwell_physics {

namespace gm = gravwell_math;

float SurfaceAligner::interpolation_factor(const AlignmentOptions& options) {
    float factor = 0.0f;
    if (options.fixed_factor) {
        factor = *options.fixed_factor;
    } else {
        factor = 1.0f - std::exp(-options.rate * options.dt);
    }
    if (!std::isfinite(factor)) {
        return 0.0f;
    }
    return std::clamp(factor, 0.0f, 1.0f);
}

gm::Quat SurfaceAligner::target_orientation(const gm::Quat& orientation, const gm::Vec3& target_up,
                                            bool preserve_forward) {
    const gm::Quat current = gm::normalize_or_identity(orientation);
    const gm::Vec3 up = gm::normalize_or(target_up, gm::vec3::UP);
    const gm::Vec3 current_up = gm::rotate(current, gm::vec3::UP);

    const gm::Quat arc = gm::quat_from_rotation_arc(current_up, up);
    const gm::Quat rotated = gm::normalize_or_identity(arc * current);
    if (!preserve_forward) {
        return rotated;
    }

    const gm::Vec3 forward = gm::reject(gm::rotate(current, gm::vec3::FORWARD), up);
    if (gm::length_squared(forward) < gm::consts::EPSILON_LOOSE) {
        return rotated;
    }
    return gm::quat_from_up_forward(up, glm::normalize(forward));
}

AlignmentResult SurfaceAligner::align(const gm::Quat& orientation, const gm::Vec3& target_up,
                                      const AlignmentOptions& options) const {
    AlignmentResult result;
    const gm::Quat current = gm::normalize_or_identity(orientation);
    result.orientation = current;

    if ((options.falling && !options.force) || !gm::is_finite(target_up) ||
        gm::length_squared(target_up) < gm::consts::EPSILON) {
        result.skipped = true;
        return result;
    }

    const float factor = interpolation_factor(options);
    const gm::Quat target = target_orientation(current, target_up, options.preserve_forward);
    const gm::Quat next = factor >= 1.0f ? target : gm::slerp(current, target, factor);

    result.orientation = gm::normalize_or_identity(next);
    result.applied_rotation = gm::normalize_or_identity(result.orientation * gm::inverse(current));
    return result;
}

} // namespace gravwell_physics
