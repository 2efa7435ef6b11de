#pragma once
#include "orientation.hpp"
#include <Jolt/Jolt.h>
#include <Jolt/Math/Quat.h>
#include <Jolt/Math/Vec3.h>
#include <cstdint>
#include <vector>

namespace gravity {

enum class ZoneShape : std::uint8_t { Box, Sphere };
enum class ZoneMode  : std::uint8_t { Directional, Point };

// A volume that imposes gravity on whatever is inside it.
//   Directional: gravity along `direction` (world space).
//   Point:       gravity toward `center` (planetoids); up = away from center.
struct GravityZone {
    std::uint32_t id           = 0;
    ZoneShape     shape        = ZoneShape::Box;
    ZoneMode      mode         = ZoneMode::Directional;
    JPH::Vec3     center       = JPH::Vec3::sZero();
    JPH::Quat     rotation     = JPH::Quat::sIdentity();
    JPH::Vec3     half_extents = JPH::Vec3::sReplicate(5.0f);
    float         radius       = 5.0f;
    JPH::Vec3     direction    = -JPH::Vec3::sAxisY();
    int           priority     = 0;
    float         strength     = 9.81f;

    bool contains(JPH::Vec3Arg point) const;
    JPH::Vec3 up_at(JPH::Vec3Arg point) const;
};

struct GravityFieldConfig {
    float transition_dot   = 0.999f;   // zone changes closer than this do not fire a transition
    float default_strength = 9.81f;
};

// ---------------------------------------------------------------------------
// GravityField
//
// The OrientationSource backed by gravity zones. update() resolves the zone
// containing the character (highest priority wins, ties go to the first
// registered) and publishes its up.
//
// Outside every zone the field is unconstrained (zero-g): gravity() is zero
// and up stays at the last valid up until something freezes a new one.
//
// Switching to a zone whose up differs by more than transition_dot fires
// on_gravity_transition_started(), publishes the new up, then fires
// on_gravity_transition_completed(). Inside a point zone up follows the
// position continuously without firing.
// ---------------------------------------------------------------------------

class GravityField final : public OrientationSource {
public:
    static constexpr std::uint32_t kNoZone = 0xffffffffu;

    explicit GravityField(GravityFieldConfig config = {});

    void set_config(const GravityFieldConfig& config) { config_ = config; }
    const GravityFieldConfig& config() const { return config_; }

    void set_zones(std::vector<GravityZone> zones) { zones_ = std::move(zones); }
    const std::vector<GravityZone>& zones() const { return zones_; }

    void add_listener(GravityTransitionListener* listener);
    void remove_listener(GravityTransitionListener* listener);

    // Re-evaluates the active zone for a world position.
    void update(JPH::Vec3Arg position);

    OrientationFrame frame() const override { return frame_; }
    bool is_transitioning() const override { return transitioning_; }
    void freeze_up(JPH::Vec3Arg up) override;

    // Gravity acceleration; zero in zero-g.
    JPH::Vec3 gravity() const;

    // Gravity acceleration a body at `point` feels, without touching the
    // published frame. Zero outside every zone.
    JPH::Vec3 gravity_at(JPH::Vec3Arg point) const;

    std::uint32_t active_zone() const { return active_zone_; }
    int transition_count() const { return transition_count_; }

private:
    const GravityZone* find_zone(JPH::Vec3Arg position) const;
    void publish(JPH::Vec3Arg up, bool unconstrained, bool fire);

    GravityFieldConfig config_;
    std::vector<GravityZone> zones_;
    std::vector<GravityTransitionListener*> listeners_;

    OrientationFrame frame_;
    float            strength_      = 0.0f;
    std::uint32_t    active_zone_   = kNoZone;
    bool             transitioning_ = false;
    bool             initialized_   = false;
    int              transition_count_ = 0;
};

} // namespace gravity
