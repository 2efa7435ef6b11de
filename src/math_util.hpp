#pragma once
#include <Jolt/Jolt.h>
#include <Jolt/Math/Mat44.h>
#include <Jolt/Math/Quat.h>
#include <Jolt/Math/Vec3.h>
#include <algorithm>
#include <cmath>

namespace gravity::math {

constexpr float kPi = 3.1415926535f;
constexpr float kDegToRad = kPi / 180.0f;
constexpr float kRadToDeg = 180.0f / kPi;

// Squared length below which a direction is treated as degenerate.
constexpr float kDegenerateLengthSq = 1e-6f;

/**
 * @brief Wraps an angle in degrees into the range [-180, 180].
 */
inline float wrap_degrees(float deg) {
    while (deg < -180.0f) deg += 360.0f;
    while (deg >  180.0f) deg -= 360.0f;
    return deg;
}

/**
 * @brief Removes the component of v along the (unit) plane normal n.
 */
inline JPH::Vec3 project_on_plane(JPH::Vec3Arg v, JPH::Vec3Arg n) {
    return v - n * v.Dot(n);
}

/**
 * @brief Normalizes v, or returns fallback when v is too short to have a direction.
 */
inline JPH::Vec3 safe_normalized(JPH::Vec3Arg v, JPH::Vec3Arg fallback) {
    float len_sq = v.LengthSq();
    if (len_sq < kDegenerateLengthSq) return fallback;
    return v / std::sqrt(len_sq);
}

inline bool is_degenerate(JPH::Vec3Arg v) {
    return v.LengthSq() < kDegenerateLengthSq;
}

/**
 * @brief Direction of v on the plane perpendicular to up, or zero if v is parallel to up.
 */
inline JPH::Vec3 horizontal_direction(JPH::Vec3Arg v, JPH::Vec3Arg up) {
    return safe_normalized(project_on_plane(v, up), JPH::Vec3::sZero());
}

/**
 * @brief Reference forward on the plane perpendicular to up, used as yaw zero.
 *
 * World +Z projected onto the plane; falls back to +X, then +Y when the
 * projection degenerates.
 */
inline JPH::Vec3 reference_forward(JPH::Vec3Arg up) {
    JPH::Vec3 f = project_on_plane(JPH::Vec3::sAxisZ(), up);
    if (!is_degenerate(f)) return f.Normalized();
    f = project_on_plane(JPH::Vec3::sAxisX(), up);
    if (!is_degenerate(f)) return f.Normalized();
    return project_on_plane(JPH::Vec3::sAxisY(), up).NormalizedOr(JPH::Vec3::sAxisZ());
}

/**
 * @brief Screen-right for a view direction and up (right-handed, +Y up, +Z forward).
 */
inline JPH::Vec3 right_of(JPH::Vec3Arg forward, JPH::Vec3Arg up) {
    return forward.Cross(up);
}

/**
 * @brief Signed yaw in degrees from base to dir around up. Positive turns right.
 * @return 0 if dir has no horizontal component.
 */
inline float signed_yaw(JPH::Vec3Arg base, JPH::Vec3Arg dir, JPH::Vec3Arg up) {
    JPH::Vec3 flat = project_on_plane(dir, up);
    if (is_degenerate(flat)) return 0.0f;
    JPH::Vec3 right = right_of(base, up);
    return std::atan2(flat.Dot(right), flat.Dot(base)) * kRadToDeg;
}

/**
 * @brief Elevation of dir above the plane perpendicular to up, in degrees.
 */
inline float elevation(JPH::Vec3Arg dir, JPH::Vec3Arg up) {
    float vertical   = dir.Dot(up);
    float horizontal = project_on_plane(dir, up).Length();
    return std::atan2(vertical, horizontal) * kRadToDeg;
}

/**
 * @brief Forward vector for a yaw/pitch pair (degrees) relative to up.
 *
 * Yaw turns base around up (positive = right), pitch then tilts the result
 * toward up (positive = look up).
 */
inline JPH::Vec3 forward_from_yaw_pitch(JPH::Vec3Arg base, JPH::Vec3Arg up,
                                        float yaw_deg, float pitch_deg) {
    JPH::Vec3 yaw_fwd = JPH::Quat::sRotation(up, -yaw_deg * kDegToRad) * base;
    JPH::Vec3 axis    = right_of(yaw_fwd, up).NormalizedOr(JPH::Vec3::sAxisX());
    return (JPH::Quat::sRotation(axis, pitch_deg * kDegToRad) * yaw_fwd).Normalized();
}

/**
 * @brief Rotation whose local +Z maps to forward and local +Y lies toward up.
 */
inline JPH::Quat look_rotation(JPH::Vec3Arg forward, JPH::Vec3Arg up) {
    JPH::Vec3 z = forward.NormalizedOr(JPH::Vec3::sAxisZ());
    JPH::Vec3 x = up.Cross(z);
    if (is_degenerate(x)) x = JPH::Vec3::sAxisY().Cross(z);
    if (is_degenerate(x)) x = JPH::Vec3::sAxisX().Cross(z);
    x = x.Normalized();
    JPH::Vec3 y = z.Cross(x);
    JPH::Mat44 m(JPH::Vec4(x, 0.0f), JPH::Vec4(y, 0.0f), JPH::Vec4(z, 0.0f),
                 JPH::Vec4(0.0f, 0.0f, 0.0f, 1.0f));
    return m.GetQuaternion().Normalized();
}

/**
 * @brief Lerp between two angles in degrees along the shortest arc.
 */
inline float lerp_angle(float a, float b, float t) {
    return a + wrap_degrees(b - a) * t;
}

/**
 * @brief Hermite smoothstep of t, clamped to [0, 1].
 */
inline float smooth_step(float t) {
    t = std::clamp(t, 0.0f, 1.0f);
    return t * t * (3.0f - 2.0f * t);
}

/**
 * @brief Frame-rate independent blend factor for exponential smoothing.
 */
inline float exp_blend(float rate, float dt) {
    return 1.0f - std::exp(-rate * dt);
}

} // namespace gravity::math
