#pragma once
#include <Jolt/Jolt.h>
#include <Jolt/Math/Vec3.h>
#include <cstdint>
#include <vector>

namespace gravity {

// Identity of a struck collider. Opaque to the core; the physics adapter maps
// it to its own body ids.
using ColliderId = std::uint32_t;
constexpr ColliderId kNoCollider = 0xffffffffu;

// Query layer bits. Bit i corresponds to physics object layer i.
namespace QueryLayers {
    constexpr std::uint32_t Static    = 1u << 0;
    constexpr std::uint32_t Moving    = 1u << 1;
    constexpr std::uint32_t Character = 1u << 2;
    constexpr std::uint32_t Phase     = 1u << 3;   // obstacles the camera may be told to see through
    constexpr std::uint32_t All       = 0xffffffffu;
}

struct QueryFilter {
    std::uint32_t layer_mask = QueryLayers::All;
    ColliderId    ignore     = kNoCollider;
};

struct QueryHit {
    JPH::Vec3     point    = JPH::Vec3::sZero();
    JPH::Vec3     normal   = JPH::Vec3::sAxisY();
    float         distance = 0.0f;
    ColliderId    collider = kNoCollider;
    std::uint32_t layer    = 0;   // QueryLayers bit of the struck collider
};

// ---------------------------------------------------------------------------
// SpatialQuery: synchronous casts against the physics broad/narrow phase.
//
// direction is unit length; distances in hits are along it. *_all variants
// return every hit in ascending distance order. Single-hit variants return
// false when nothing was struck.
// ---------------------------------------------------------------------------

class SpatialQuery {
public:
    virtual ~SpatialQuery() = default;

    virtual std::vector<QueryHit> ray_cast_all(JPH::Vec3Arg origin, JPH::Vec3Arg direction,
                                               float max_distance,
                                               const QueryFilter& filter) const = 0;

    virtual std::vector<QueryHit> sphere_cast_all(JPH::Vec3Arg origin, float radius,
                                                  JPH::Vec3Arg direction, float max_distance,
                                                  const QueryFilter& filter) const = 0;

    // Capsule between the centres of its two end spheres.
    virtual bool capsule_cast(JPH::Vec3Arg point_a, JPH::Vec3Arg point_b, float radius,
                              JPH::Vec3Arg direction, float max_distance,
                              const QueryFilter& filter, QueryHit& hit) const = 0;

    virtual bool ray_cast(JPH::Vec3Arg origin, JPH::Vec3Arg direction, float max_distance,
                          const QueryFilter& filter, QueryHit& hit) const {
        std::vector<QueryHit> hits = ray_cast_all(origin, direction, max_distance, filter);
        if (hits.empty()) return false;
        hit = hits.front();
        return true;
    }
};

} // namespace gravity
