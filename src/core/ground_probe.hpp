#pragma once
#include "orientation.hpp"
#include "spatial_query.hpp"
#include "timers.hpp"
#include <Jolt/Jolt.h>
#include <Jolt/Math/Vec3.h>

namespace gravity {

struct GroundProbeConfig {
    float max_slope_deg        = 55.0f;
    float hysteresis_deg       = 2.0f;
    float ground_check_radius  = 0.3f;
    float probe_extra_distance = 0.15f;
    float underfoot_tolerance  = 0.22f;
    float jump_grace_seconds   = 0.2f;
    float capsule_lift         = 0.02f;   // cast starts this far above the resting capsule
    float capsule_radius_scale = 0.98f;
};

struct GroundContact {
    bool       has_hit   = false;
    bool       walkable  = false;
    float      slope_deg = 0.0f;
    float      distance  = 0.0f;
    JPH::Vec3  normal    = JPH::Vec3::sAxisY();
    JPH::Vec3  point     = JPH::Vec3::sZero();
    ColliderId collider  = kNoCollider;

    bool is_sliding() const { return has_hit && !walkable; }
};

// Character volume and placement for one probe.
struct ProbeRequest {
    JPH::Vec3   foot_position  = JPH::Vec3::sZero();   // base of the capsule
    JPH::Vec3   up             = JPH::Vec3::sAxisY();
    float       capsule_radius = 0.4f;
    float       capsule_height = 1.8f;
    QueryFilter filter;
};

// ---------------------------------------------------------------------------
// GroundProbe
//
// Classifies the surface under the character relative to the current up.
// Sweeps the character capsule along -up (single ray fallback), keeps only
// hits that are actually underfoot, and applies a hysteresis band around the
// max slope so a surface at the threshold does not flicker.
//
// The up used for classification is filtered through an UpTracker, so an up
// change smaller than 1 degree cannot alter the result.
// ---------------------------------------------------------------------------

class GroundProbe {
public:
    explicit GroundProbe(GroundProbeConfig config = {});

    void set_query(const SpatialQuery* query) { query_ = query; }
    void set_config(const GroundProbeConfig& config) { config_ = config; }
    const GroundProbeConfig& config() const { return config_; }

    // Runs one fixed-step probe and returns the fresh contact.
    const GroundContact& update(const ProbeRequest& request, float dt);

    // Suppresses probing for the jump grace window.
    void notify_jumped();

    const GroundContact& contact() const { return contact_; }
    bool was_walkable() const { return previous_walkable_; }
    bool is_suppressed() const { return grace_.active(); }
    const JPH::Vec3& settled_up() const { return up_.current(); }

    // slope <= max + hysteresis when previously walkable, max - hysteresis otherwise.
    static bool classify_walkable(float slope_deg, float max_slope_deg,
                                  float hysteresis_deg, bool previously_walkable);

    // A hit is underfoot when it is not above origin along up (0.01 slack)
    // and its sideways offset is within lateral_tolerance.
    static bool is_underfoot(JPH::Vec3Arg origin, JPH::Vec3Arg point, JPH::Vec3Arg up,
                             float lateral_tolerance);

private:
    bool try_capsule(const ProbeRequest& request, JPH::Vec3Arg up, QueryHit& hit) const;
    bool try_ray(const ProbeRequest& request, JPH::Vec3Arg up, QueryHit& hit) const;
    void fill(const QueryHit& hit, JPH::Vec3Arg up);

    GroundProbeConfig   config_;
    const SpatialQuery* query_ = nullptr;
    UpTracker           up_;
    CountdownTimer      grace_;
    GroundContact       contact_;
    bool                previous_walkable_ = false;
};

} // namespace gravity
