/// @file alignment.hpp
/// @brief Smooth reorientation of a body's up axis toward a surface normal

#pragma once

#include "fwd.hpp"

#include <gravwell/math/quat.hpp>

#include <optional>

namespace gravwell_physics {

/// Per-call alignment settings
struct AlignmentOptions {
    float rate = 8.0f;                      ///< Exponential smoothing rate (1/s)
    float dt = 0.0f;
    std::optional<float> fixed_factor;      ///< Per-call slerp factor, overrides rate
    bool preserve_forward = false;          ///< Keep the current heading in the new tangent plane
    bool force = false;                     ///< Align even while falling
    bool falling = false;
};

struct AlignmentResult {
    gravwell_math::Quat orientation = gravwell_math::quat::IDENTITY;
    gravwell_math::Quat applied_rotation = gravwell_math::quat::IDENTITY;  ///< orientation * inverse(previous)
    bool skipped = false;
};

class SurfaceAligner {
public:
    /// Rotate `orientation` so its local +Y moves toward `target_up`
    [[nodiscard]] AlignmentResult align(const gravwell_math::Quat& orientation,
                                        const gravwell_math::Vec3& target_up,
                                        const AlignmentOptions& options) const;

    /// fixed_factor when set, else 1 - exp(-rate * dt), clamped to [0, 1]
    [[nodiscard]] static float interpolation_factor(const AlignmentOptions& options);

    /// Fully aligned orientation for `target_up`
    [[nodiscard]] static gravwell_math::Quat target_orientation(const gravwell_math::Quat& orientation,
                                                                const gravwell_math::Vec3& target_up,
                                                                bool preserve_forward);
};

} // namespace gravwell_physics
