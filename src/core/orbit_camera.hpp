#pragma once
#include "camera_collision.hpp"
#include "cursor_control.hpp"
#include "offset_compositor.hpp"
#include "orientation.hpp"
#include "spatial_query.hpp"
#include "timers.hpp"
#include <Jolt/Jolt.h>
#include <Jolt/Math/Quat.h>
#include <Jolt/Math/Vec3.h>
#include <cstdint>
#include <functional>

namespace gravity {

enum class PanMode : std::uint8_t { Idle, PrimaryOrbit, SecondaryFreeLook, ExternallyDriven };

const char* pan_mode_name(PanMode mode);

struct ButtonState {
    bool pressed  = false;   // went down this frame
    bool held     = false;   // down now (true on the press frame)
    bool released = false;   // went up this frame
};

struct CharacterPose {
    JPH::Vec3  position = JPH::Vec3::sZero();
    JPH::Quat  rotation = JPH::Quat::sIdentity();
    ColliderId body     = kNoCollider;   // never treated as an obstruction
};

// Everything the camera reads from the outside in one variable-rate frame.
struct CameraFrameInput {
    float pointer_dx = 0.0f;   // positive = right
    float pointer_dy = 0.0f;   // positive = up
    float pointer_x  = 0.0f;   // screen position, for warp-back after a pan
    float pointer_y  = 0.0f;
    float scroll     = 0.0f;   // positive = zoom in

    ButtonState primary;       // orbit + steer
    ButtonState secondary;     // free-look only
    bool        pointer_over_ui = false;

    CharacterPose character;
};

struct OrbitCameraConfig {
    float min_zoom             = 0.1f;
    float max_zoom             = 50.0f;
    int   zoom_in_ticks        = 15;
    int   zoom_out_ticks       = 20;
    float zoom_smoothing       = 10.0f;
    float zoom_exponent        = 1.5f;
    float start_zoom_percent   = 0.5f;
    float first_person_margin  = 0.1f;

    float pan_sensitivity      = 2.0f;
    float max_pitch_deg        = 60.0f;
    float default_pitch_deg    = -10.0f;

    JPH::Vec3 target_offset    = JPH::Vec3(0.0f, 1.5f, 0.0f);   // character-local

    float collision_buffer     = 0.2f;
    float probe_radius         = 0.2f;
    int   collision_quality    = 6;
    float ring_min_distance    = 5.0f;
    std::uint32_t obstruction_mask = QueryLayers::All;

    float stabilization_seconds    = 0.2f;
    float significant_change_dot   = 0.5f;
    float transition_pitch_deg     = -10.0f;
    float auto_align_idle_seconds  = 2.0f;
    float auto_align_seconds       = 0.35f;
    float free_look_return_seconds = 0.35f;
};

// ---------------------------------------------------------------------------
// OrbitCameraController
//
// Gravity-relative orbit camera. Yaw and pitch are measured in the plane
// perpendicular to the current up, so the camera keeps behaving like a
// normal third-person orbit on walls, ceilings and planetoids.
//
// Modes (edge-triggered from the two buttons):
//   PrimaryOrbit       rotates and raises the shared "is panning" flag that
//                      the character steers by
//   SecondaryFreeLook  rotates only; on release eases back to the seat it had
//                      relative to the character when the look started
//   ExternallyDriven   an ability owns the camera; input is ignored and the
//                      cursor state from before is restored on release
//
// Zero-g (unconstrained frame): yaw/pitch accumulate around a frame frozen at
// pan start with no clamp; idle holds the rotation as-is and a pan release
// pins the orientation source's up to the camera's up.
//
// Gravity transitions arrive through GravityTransitionListener. Up changes
// with dot >= cos 1 deg never reach yaw/pitch.
// ---------------------------------------------------------------------------

class OrbitCameraController final : public GravityTransitionListener {
public:
    using FirstPersonListener = std::function<void(bool first_person)>;

    explicit OrbitCameraController(OrbitCameraConfig config = {});

    void set_config(const OrbitCameraConfig& config);
    const OrbitCameraConfig& config() const { return config_; }

    void set_orientation_source(OrientationSource* source) { orientation_ = source; }
    void set_spatial_query(const SpatialQuery* query) { query_ = query; }
    void set_cursor(CursorControl* cursor) { cursor_ = cursor; }
    void set_first_person_listener(FirstPersonListener listener) { first_person_listener_ = std::move(listener); }

    void update(const CameraFrameInput& input, float dt);

    // Back to Idle, default pitch, start zoom; snaps behind the character on
    // the next update.
    void reset();

    // --- Outputs ---
    JPH::Vec3 camera_forward()  const { return forward_; }
    JPH::Vec3 camera_right()    const { return right_; }
    JPH::Vec3 camera_up()       const { return cam_up_; }
    JPH::Vec3 camera_position() const { return position_; }
    JPH::Vec3 pivot()           const { return pivot_; }
    JPH::Quat rotation()        const { return rotation_; }
    JPH::Vec3 current_up()      const { return up_.current(); }

    bool    is_in_first_person()       const { return first_person_; }
    bool    is_panning_active()        const;
    bool    is_free_look_only_active() const { return mode_ == PanMode::SecondaryFreeLook; }
    bool    is_stabilizing()           const { return stabilize_.active(); }
    bool    is_auto_aligning()         const { return align_.active(); }
    PanMode pan_mode()                 const { return mode_; }

    float yaw()           const { return yaw_; }
    float pitch()         const { return pitch_; }
    float zoom_percent()  const { return zoom_percent_; }
    float zoom_distance() const { return zoom_distance_; }
    float target_zoom_distance() const;
    std::uint32_t collision_mask() const { return collision_mask_; }

    // --- Mutators for abilities ---

    // active=true hands the camera to an ability (ExternallyDriven). On
    // release it falls back to a still-held button's mode, or to Idle with
    // the pre-entry cursor state. force=true always returns to Idle.
    void set_panning_active(bool active, bool force = false);

    // Additive world offset for this frame only.
    void set_external_camera_offset(JPH::Vec3Arg offset) { offsets_.add(offset); }

    // Adopts up immediately and levels the camera on it.
    void force_orientation_update(JPH::Vec3Arg up);

    // Eases yaw to behind the character's facing. Replaces a running align;
    // the replaced one's callback is dropped. on_complete runs on finish only.
    void start_auto_align_behind_character(float duration, std::function<void()> on_complete = {});

    // Drops the Phase layer from obstruction checks; false restores the exact
    // mask that was in place before.
    void set_collision_mask_phase_ignore(bool ignore);

    // GravityTransitionListener
    void on_gravity_transition_started() override;
    void on_gravity_transition_completed() override;

private:
    enum class Button : std::uint8_t { None, Primary, Secondary };

    OrientationFrame read_frame() const;
    JPH::Vec3 character_forward() const;
    float behind_yaw(JPH::Vec3Arg up) const;
    PanMode held_mode() const;

    void update_buttons(const CameraFrameInput& input, bool space);
    void enter_mode(PanMode next, const CameraFrameInput& input, bool space);
    void leave_to_idle(PanMode from, bool space);
    void update_zoom(const CameraFrameInput& input, float dt, bool accept_scroll);
    void apply_look(const CameraFrameInput& input, float dt, bool space);
    void advance_alignment(float dt, JPH::Vec3Arg up);
    void begin_space_pan();
    void build_rotation(JPH::Vec3Arg up, bool space);
    void place(const CameraFrameInput& input);
    void update_first_person();
    void set_first_person(bool fp);
    void reseat_on_forward(JPH::Vec3Arg up);
    void begin_ease(float target_yaw, float duration, std::function<void()> on_complete);
    void cancel_alignment();
    void lock_cursor(bool locked);

    OrbitCameraConfig   config_;
    OrientationSource*  orientation_ = nullptr;
    const SpatialQuery* query_       = nullptr;
    CursorControl*      cursor_      = nullptr;
    FirstPersonListener first_person_listener_;

    CharacterPose character_;
    UpTracker     up_;
    bool          was_space_    = false;
    bool          snap_behind_  = true;

    // Orbit state
    float yaw_           = 0.0f;
    float pitch_         = 0.0f;
    float zoom_percent_  = 0.5f;
    float zoom_distance_ = 0.0f;

    // Pan state
    PanMode mode_             = PanMode::Idle;
    bool    primary_down_     = false;
    bool    secondary_down_   = false;
    Button  last_pressed_     = Button::None;
    float   free_look_offset_ = 0.0f;   // yaw - behind_yaw at free-look entry
    bool    saved_cursor_locked_ = false;
    float   anchor_x_ = 0.0f;
    float   anchor_y_ = 0.0f;
    float   pointer_x_ = 0.0f;
    float   pointer_y_ = 0.0f;

    // Zero-g pan frame
    bool      space_pan_     = false;
    JPH::Vec3 space_forward_ = JPH::Vec3::sAxisZ();
    JPH::Vec3 space_up_      = JPH::Vec3::sAxisY();
    float     space_yaw_     = 0.0f;
    float     space_pitch_   = 0.0f;

    // Pose
    JPH::Vec3 forward_  = JPH::Vec3::sAxisZ();
    JPH::Vec3 right_    = -JPH::Vec3::sAxisX();
    JPH::Vec3 cam_up_   = JPH::Vec3::sAxisY();
    JPH::Quat rotation_ = JPH::Quat::sIdentity();
    JPH::Vec3 pivot_    = JPH::Vec3::sZero();
    JPH::Vec3 position_ = JPH::Vec3::sZero();

    bool first_person_ = false;

    std::uint32_t collision_mask_ = QueryLayers::All;
    std::uint32_t saved_mask_     = QueryLayers::All;
    bool          phase_ignored_  = false;

    ExternalOffsetCompositor offsets_;

    // Timed sequences
    CountdownTimer        idle_;
    EaseTimer             align_;
    float                 align_from_ = 0.0f;
    float                 align_to_   = 0.0f;
    std::function<void()> align_done_;
    CountdownTimer        stabilize_;

    // Transition snapshot
    bool      transition_open_    = false;
    JPH::Vec3 transition_prev_up_ = JPH::Vec3::sAxisY();
    JPH::Vec3 transition_forward_ = JPH::Vec3::sAxisZ();
    JPH::Vec3 transition_right_   = -JPH::Vec3::sAxisX();
    float     transition_yaw_     = 0.0f;
};

} // namespace gravity
