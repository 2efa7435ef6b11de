#include "orientation.hpp"

namespace gravity {

JPH::Vec3 sanitize_up(JPH::Vec3Arg up, JPH::Vec3Arg fallback) {
    if (up.LengthSq() < 1e-4f) return fallback.NormalizedOr(JPH::Vec3::sAxisY());
    return up.Normalized();
}

OrientationFrame OrientationFrame::make(JPH::Vec3Arg up, bool unconstrained) {
    return {sanitize_up(up), unconstrained};
}

FixedOrientationSource::FixedOrientationSource(JPH::Vec3Arg up, bool unconstrained)
    : frame_(OrientationFrame::make(up, unconstrained)) {}

void FixedOrientationSource::freeze_up(JPH::Vec3Arg up) {
    frame_.up = sanitize_up(up, frame_.up);
    ++freeze_count_;
}

UpTracker::UpTracker(JPH::Vec3Arg initial)
    : current_(sanitize_up(initial)), previous_(current_) {}

bool UpTracker::observe(JPH::Vec3Arg up) {
    JPH::Vec3 clean = sanitize_up(up, current_);
    if (is_same_up(current_, clean)) return false;
    previous_ = current_;
    current_  = clean;
    return true;
}

void UpTracker::reset(JPH::Vec3Arg up) {
    current_  = sanitize_up(up, current_);
    previous_ = current_;
}

} // namespace gravity
