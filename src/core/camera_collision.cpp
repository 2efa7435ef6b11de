#include "camera_collision.hpp"
#include "../math_util.hpp"
#include <algorithm>
#include <cmath>

namespace gravity {

namespace {

bool nearest_valid(const std::vector<QueryHit>& hits, float max_distance, ColliderId ignore,
                   QueryHit& best) {
    bool  found     = false;
    float best_dist = max_distance;
    for (const auto& h : hits) {
        if (h.collider == ignore && ignore != kNoCollider) continue;
        if (h.distance < best_dist) {
            best_dist = h.distance;
            best      = h;
            found     = true;
        }
    }
    return found;
}

JPH::Vec3 pushed_out(const QueryHit& hit, float buffer) {
    return hit.point + hit.normal * buffer;
}

} // namespace

JPH::Vec3 resolve_camera_collision(const SpatialQuery& query, JPH::Vec3Arg pivot,
                                   JPH::Vec3Arg desired, JPH::Vec3Arg up,
                                   const CameraCollisionSettings& settings) {
    JPH::Vec3 line     = desired - pivot;
    float     distance = line.Length();
    if (distance < settings.min_distance) return desired;

    JPH::Vec3 dir = line / distance;
    QueryHit  hit;

    // 1) Straight line.
    if (nearest_valid(query.ray_cast_all(pivot, dir, distance, settings.filter), distance,
                      settings.filter.ignore, hit)) {
        return pushed_out(hit, settings.buffer);
    }

    // 2) Fat line, catches thin edges the ray slips past.
    if (nearest_valid(query.sphere_cast_all(pivot, settings.probe_radius, dir, distance,
                                            settings.filter),
                      distance, settings.filter.ignore, hit)) {
        return pushed_out(hit, settings.buffer);
    }

    // 3) Ring of parallel rays.
    if (distance <= settings.ring_min_distance) return desired;

    JPH::Vec3 right = dir.Cross(up);
    if (math::is_degenerate(right)) right = dir.Cross(JPH::Vec3::sAxisX());
    if (math::is_degenerate(right)) right = dir.Cross(JPH::Vec3::sAxisZ());
    right = right.Normalized();
    JPH::Vec3 ring_up = right.Cross(dir).Normalized();

    const int count = std::min(settings.ring_quality, 6);
    bool  found     = false;
    float best_dist = distance;
    for (int i = 0; i < count; ++i) {
        float     angle  = (static_cast<float>(i) / static_cast<float>(count)) * 2.0f * math::kPi;
        JPH::Vec3 offset = (right * std::cos(angle) + ring_up * std::sin(angle)) * settings.probe_radius;

        QueryHit ring_hit;
        if (!query.ray_cast(pivot + offset, dir, distance, settings.filter, ring_hit)) continue;
        if (ring_hit.collider == settings.filter.ignore && settings.filter.ignore != kNoCollider) continue;
        if (ring_hit.distance < best_dist) {
            best_dist = ring_hit.distance;
            hit       = ring_hit;
            found     = true;
        }
    }
    return found ? pushed_out(hit, settings.buffer) : desired;
}

} // namespace gravity
