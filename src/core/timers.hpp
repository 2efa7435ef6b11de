#pragma once
#include "../math_util.hpp"
#include <algorithm>

namespace gravity {

// ---------------------------------------------------------------------------
// Tick-driven timers. Owners advance them once per update with the frame (or
// fixed-step) dt; abort() stops them on the spot without finishing. Nothing
// here blocks or schedules.
// ---------------------------------------------------------------------------

class CountdownTimer {
public:
    void start(float seconds) {
        remaining_ = seconds;
        active_    = seconds > 0.0f;
    }

    // Returns true on the tick the timer runs out.
    bool advance(float dt) {
        if (!active_) return false;
        remaining_ -= dt;
        if (remaining_ > 0.0f) return false;
        remaining_ = 0.0f;
        active_    = false;
        return true;
    }

    void abort() {
        active_    = false;
        remaining_ = 0.0f;
    }

    bool  active()    const { return active_; }
    float remaining() const { return remaining_; }

private:
    float remaining_ = 0.0f;
    bool  active_    = false;
};

// Smoothstepped 0..1 progress over a duration.
class EaseTimer {
public:
    void start(float duration) {
        duration_ = std::max(0.01f, duration);
        elapsed_  = 0.0f;
        active_   = true;
    }

    // Returns eased progress after advancing. Goes inactive once it reaches 1.
    float advance(float dt) {
        if (active_) {
            elapsed_ = std::min(duration_, elapsed_ + dt);
            if (elapsed_ >= duration_) active_ = false;
        }
        return eased();
    }

    void abort() { active_ = false; }

    bool  active()   const { return active_; }
    float progress() const { return elapsed_ / duration_; }
    float eased()    const { return math::smooth_step(progress()); }

private:
    float duration_ = 1.0f;
    float elapsed_  = 0.0f;
    bool  active_   = false;
};

} // namespace gravity
