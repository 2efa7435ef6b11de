#pragma once
#include <Jolt/Jolt.h>
#include <Jolt/Math/Vec3.h>

namespace gravity {

// ---------------------------------------------------------------------------
// ExternalOffsetCompositor
//
// Short-lived camera effects (recoil, lag, shake) push world-space offsets
// here during a frame. The camera consumes the sum exactly once per update;
// nothing carries over to the next frame.
// ---------------------------------------------------------------------------

class ExternalOffsetCompositor {
public:
    void add(JPH::Vec3Arg offset) { pending_ += offset; }

    JPH::Vec3 consume() {
        JPH::Vec3 out = pending_;
        pending_ = JPH::Vec3::sZero();
        return out;
    }

    const JPH::Vec3& pending() const { return pending_; }

private:
    JPH::Vec3 pending_ = JPH::Vec3::sZero();
};

} // namespace gravity
