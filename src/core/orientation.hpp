#pragma once
#include <Jolt/Jolt.h>
#include <Jolt/Math/Vec3.h>

namespace gravity {

// cos(1 deg). Up vectors closer than this are treated as the same up.
constexpr float kSameGravityDot = 0.99985f;

// ---------------------------------------------------------------------------
// OrientationFrame
//
// The "current up" for a location plus the zero-g flag. up is always unit
// length: degenerate input is replaced with the default up on construction.
// ---------------------------------------------------------------------------

struct OrientationFrame {
    JPH::Vec3 up            = JPH::Vec3::sAxisY();
    bool      unconstrained = false;

    static OrientationFrame make(JPH::Vec3Arg up, bool unconstrained);
};

// Returns up normalized, or fallback if up is near zero length.
JPH::Vec3 sanitize_up(JPH::Vec3Arg up, JPH::Vec3Arg fallback = JPH::Vec3::sAxisY());

// ---------------------------------------------------------------------------
// OrientationSource: single writer of the current up.
//
// The camera and the ground probe read frame() every tick. freeze_up() is the
// one permitted write from a reader: the camera pins up to its own up when a
// zero-g pan is released.
// ---------------------------------------------------------------------------

class OrientationSource {
public:
    virtual ~OrientationSource() = default;

    virtual OrientationFrame frame() const = 0;
    virtual bool is_transitioning() const { return false; }
    virtual void freeze_up(JPH::Vec3Arg up) = 0;
};

// Fixed world up. Used when no gravity field is present, and in tests.
class FixedOrientationSource final : public OrientationSource {
public:
    explicit FixedOrientationSource(JPH::Vec3Arg up = JPH::Vec3::sAxisY(), bool unconstrained = false);

    OrientationFrame frame() const override { return frame_; }
    void freeze_up(JPH::Vec3Arg up) override;

    void set_up(JPH::Vec3Arg up) { frame_.up = sanitize_up(up, frame_.up); }
    void set_unconstrained(bool unconstrained) { frame_.unconstrained = unconstrained; }

    int freeze_count() const { return freeze_count_; }

private:
    OrientationFrame frame_;
    int freeze_count_ = 0;
};

// Receives gravity transition notifications from the orientation owner.
class GravityTransitionListener {
public:
    virtual ~GravityTransitionListener() = default;
    virtual void on_gravity_transition_started() = 0;
    virtual void on_gravity_transition_completed() = 0;
};

// ---------------------------------------------------------------------------
// UpTracker
//
// Filters the raw up so that numerically-identical changes (dot >= cos 1 deg)
// never reach dependent state. observe() returns true when the settled up
// actually moved; previous() then holds the value it moved from.
// ---------------------------------------------------------------------------

class UpTracker {
public:
    explicit UpTracker(JPH::Vec3Arg initial = JPH::Vec3::sAxisY());

    bool observe(JPH::Vec3Arg up);
    void reset(JPH::Vec3Arg up);

    const JPH::Vec3& current()  const { return current_; }
    const JPH::Vec3& previous() const { return previous_; }

    static bool is_same_up(JPH::Vec3Arg a, JPH::Vec3Arg b) { return a.Dot(b) >= kSameGravityDot; }

private:
    JPH::Vec3 current_;
    JPH::Vec3 previous_;
};

} // namespace gravity
