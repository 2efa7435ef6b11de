#pragma once
#include "spatial_query.hpp"
#include <Jolt/Jolt.h>
#include <Jolt/Math/Vec3.h>

namespace gravity {

struct CameraCollisionSettings {
    float       min_distance      = 0.3f;   // pivot->desired shorter than this is never corrected
    float       buffer            = 0.2f;   // pushed out along the hit normal
    float       probe_radius      = 0.2f;   // sphere sweep radius and ring radius
    int         ring_quality      = 6;      // ring rays, capped at 6
    float       ring_min_distance = 5.0f;   // ring pass only beyond this distance
    QueryFilter filter;
};

// Returns where the camera may sit on the pivot->desired line without
// clipping into geometry. Three passes, first success wins:
//   1. every ray hit along the line, nearest valid one
//   2. sphere sweep of probe_radius along the line
//   3. for long lines, ring_quality parallel rays around it, nearest hit
// The accepted point is hit.point + hit.normal * buffer. No hit -> desired.
JPH::Vec3 resolve_camera_collision(const SpatialQuery& query, JPH::Vec3Arg pivot,
                                   JPH::Vec3Arg desired, JPH::Vec3Arg up,
                                   const CameraCollisionSettings& settings);

} // namespace gravity
