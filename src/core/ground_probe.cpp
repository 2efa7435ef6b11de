#include "ground_probe.hpp"
#include "../math_util.hpp"
#include <algorithm>
#include <cmath>

namespace gravity {

GroundProbe::GroundProbe(GroundProbeConfig config) : config_(config) {}

bool GroundProbe::classify_walkable(float slope_deg, float max_slope_deg,
                                    float hysteresis_deg, bool previously_walkable) {
    float limit = max_slope_deg + (previously_walkable ? hysteresis_deg : -hysteresis_deg);
    return slope_deg <= limit;
}

bool GroundProbe::is_underfoot(JPH::Vec3Arg origin, JPH::Vec3Arg point, JPH::Vec3Arg up,
                               float lateral_tolerance) {
    JPH::Vec3 to_hit = point - origin;
    float below   = -to_hit.Dot(up);
    float lateral = math::project_on_plane(to_hit, up).Length();
    return below > -0.01f && lateral <= lateral_tolerance;
}

void GroundProbe::notify_jumped() {
    grace_.start(config_.jump_grace_seconds);
    contact_           = {};
    previous_walkable_ = false;
}

const GroundContact& GroundProbe::update(const ProbeRequest& request, float dt) {
    up_.observe(request.up);
    const JPH::Vec3 up = up_.current();

    // Takeoff frames are never ground.
    bool suppressed = grace_.active();
    grace_.advance(dt);
    if (suppressed) {
        contact_           = {};
        previous_walkable_ = false;
        return contact_;
    }

    contact_ = {};
    if (query_) {
        QueryHit hit;
        if (try_capsule(request, up, hit) || try_ray(request, up, hit)) {
            fill(hit, up);
        }
    }
    previous_walkable_ = contact_.walkable;
    return contact_;
}

bool GroundProbe::try_capsule(const ProbeRequest& request, JPH::Vec3Arg up, QueryHit& hit) const {
    const float radius = std::max(0.01f, request.capsule_radius);
    const float height = std::max(radius * 2.0f + 0.01f, request.capsule_height);
    const float dist   = config_.ground_check_radius + config_.probe_extra_distance;

    JPH::Vec3 lift   = up * config_.capsule_lift;
    JPH::Vec3 bottom = request.foot_position + up * radius + lift;
    JPH::Vec3 top    = request.foot_position + up * (height - radius) + lift;

    if (!query_->capsule_cast(bottom, top, radius * config_.capsule_radius_scale, -up, dist,
                              request.filter, hit)) {
        return false;
    }
    float tolerance = std::max(config_.underfoot_tolerance, config_.ground_check_radius * 0.8f);
    return hit.normal.Dot(up) >= 0.0f &&
           is_underfoot(request.foot_position, hit.point, up, tolerance);
}

bool GroundProbe::try_ray(const ProbeRequest& request, JPH::Vec3Arg up, QueryHit& hit) const {
    const float dist = config_.ground_check_radius + config_.probe_extra_distance;
    JPH::Vec3 origin = request.foot_position + up * config_.capsule_lift;

    if (!query_->ray_cast(origin, -up, dist + config_.capsule_lift, request.filter, hit)) {
        return false;
    }
    float tolerance = std::max(config_.underfoot_tolerance, config_.ground_check_radius * 0.8f);
    return hit.normal.Dot(up) >= 0.0f &&
           is_underfoot(request.foot_position, hit.point, up, tolerance);
}

void GroundProbe::fill(const QueryHit& hit, JPH::Vec3Arg up) {
    JPH::Vec3 normal = math::safe_normalized(hit.normal, up);
    float cos_slope  = std::clamp(normal.Dot(up), -1.0f, 1.0f);

    contact_.has_hit   = true;
    contact_.normal    = normal;
    contact_.point     = hit.point;
    contact_.distance  = hit.distance;
    contact_.collider  = hit.collider;
    contact_.slope_deg = std::acos(cos_slope) * math::kRadToDeg;
    contact_.walkable  = classify_walkable(contact_.slope_deg, config_.max_slope_deg,
                                           config_.hysteresis_deg, previous_walkable_);
}

} // namespace gravity
