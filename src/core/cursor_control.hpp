#pragma once

namespace gravity {

// Platform cursor as seen by the camera: lock/hide while panning and warp
// back to where the pan started.
class CursorControl {
public:
    virtual ~CursorControl() = default;

    virtual bool is_locked() const = 0;
    virtual void set_locked(bool locked) = 0;
    virtual void warp(float x, float y) = 0;
};

} // namespace gravity
