#include "orbit_camera.hpp"
#include "../math_util.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

namespace gravity {

const char* pan_mode_name(PanMode mode) {
    switch (mode) {
        case PanMode::Idle:              return "Idle";
        case PanMode::PrimaryOrbit:      return "Orbit";
        case PanMode::SecondaryFreeLook: return "FreeLook";
        case PanMode::ExternallyDriven:  return "External";
    }
    return "?";
}

OrbitCameraController::OrbitCameraController(OrbitCameraConfig config) : config_(config) {
    collision_mask_ = config_.obstruction_mask;
    saved_mask_     = collision_mask_;
    reset();
}

void OrbitCameraController::set_config(const OrbitCameraConfig& config) {
    config_ = config;
    if (phase_ignored_) {
        saved_mask_     = config_.obstruction_mask;
        collision_mask_ = saved_mask_ & ~QueryLayers::Phase;
    } else {
        collision_mask_ = config_.obstruction_mask;
    }
    zoom_percent_ = std::clamp(zoom_percent_, 0.0f, 1.0f);
}

void OrbitCameraController::reset() {
    cancel_alignment();
    idle_.abort();
    stabilize_.abort();

    if (mode_ != PanMode::Idle) lock_cursor(saved_cursor_locked_);
    mode_             = PanMode::Idle;
    primary_down_     = false;
    secondary_down_   = false;
    last_pressed_     = Button::None;
    free_look_offset_ = 0.0f;

    space_pan_   = false;
    space_yaw_   = 0.0f;
    space_pitch_ = 0.0f;

    yaw_           = 0.0f;
    pitch_         = std::clamp(config_.default_pitch_deg, -config_.max_pitch_deg, config_.max_pitch_deg);
    zoom_percent_  = std::clamp(config_.start_zoom_percent, 0.0f, 1.0f);
    zoom_distance_ = target_zoom_distance();
    set_first_person(zoom_distance_ <= config_.min_zoom + config_.first_person_margin);

    transition_open_ = false;
    offsets_.consume();
    snap_behind_ = true;
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

OrientationFrame OrbitCameraController::read_frame() const {
    if (!orientation_) return OrientationFrame{};
    return orientation_->frame();
}

JPH::Vec3 OrbitCameraController::character_forward() const {
    return character_.rotation * JPH::Vec3::sAxisZ();
}

float OrbitCameraController::behind_yaw(JPH::Vec3Arg up) const {
    JPH::Vec3 flat = math::horizontal_direction(character_forward(), up);
    if (math::is_degenerate(flat)) return yaw_;
    return math::signed_yaw(math::reference_forward(up), flat, up);
}

PanMode OrbitCameraController::held_mode() const {
    if (primary_down_ && secondary_down_) {
        return last_pressed_ == Button::Secondary ? PanMode::SecondaryFreeLook : PanMode::PrimaryOrbit;
    }
    if (primary_down_)   return PanMode::PrimaryOrbit;
    if (secondary_down_) return PanMode::SecondaryFreeLook;
    return PanMode::Idle;
}

float OrbitCameraController::target_zoom_distance() const {
    float shaped = std::pow(zoom_percent_, std::max(1.0f, config_.zoom_exponent));
    return config_.min_zoom + (config_.max_zoom - config_.min_zoom) * shaped;
}

bool OrbitCameraController::is_panning_active() const {
    return mode_ == PanMode::PrimaryOrbit || mode_ == PanMode::ExternallyDriven;
}

void OrbitCameraController::lock_cursor(bool locked) {
    if (cursor_) cursor_->set_locked(locked);
}

// ---------------------------------------------------------------------------
// Per-frame update
// ---------------------------------------------------------------------------

void OrbitCameraController::update(const CameraFrameInput& input, float dt) {
    character_ = input.character;
    pointer_x_ = input.pointer_x;
    pointer_y_ = input.pointer_y;

    const OrientationFrame frame = read_frame();
    const bool space = frame.unconstrained;

    if (snap_behind_) {
        up_.reset(frame.up);
        yaw_ = math::wrap_degrees(behind_yaw(up_.current()));
        build_rotation(up_.current(), false);
        snap_behind_ = false;
    }

    const bool up_moved = !space && up_.observe(frame.up);
    const JPH::Vec3 up = up_.current();

    // Leaving zero-g, or up moving outside a transition: re-seat yaw/pitch on
    // the held forward.
    if (was_space_ && !space) {
        reseat_on_forward(up);
        space_pan_ = false;
    } else if (up_moved && !transition_open_) {
        reseat_on_forward(up);
    }

    stabilize_.advance(dt);
    const bool accept_input = !stabilize_.active() && mode_ != PanMode::ExternallyDriven;

    update_buttons(input, space);
    update_zoom(input, dt, accept_input);
    if (accept_input) apply_look(input, dt, space);

    advance_alignment(dt, up);

    if (!space) pitch_ = std::clamp(pitch_, -config_.max_pitch_deg, config_.max_pitch_deg);

    build_rotation(up, space);
    place(input);
    update_first_person();

    was_space_ = space;
}

void OrbitCameraController::update_buttons(const CameraFrameInput& input, bool space) {
    const bool primary_press   = input.primary.pressed && !input.pointer_over_ui;
    const bool secondary_press = input.secondary.pressed && !input.pointer_over_ui;

    if (primary_press) {
        primary_down_ = true;
        last_pressed_ = Button::Primary;
    }
    if (secondary_press) {
        secondary_down_ = true;
        // Same-frame presses resolve to the primary button.
        if (!primary_press) last_pressed_ = Button::Secondary;
    }
    if (!input.primary.held || input.primary.released)     primary_down_   = false;
    if (!input.secondary.held || input.secondary.released) secondary_down_ = false;

    if (mode_ == PanMode::ExternallyDriven) return;

    PanMode next = held_mode();
    if (next != mode_) enter_mode(next, input, space);
}

void OrbitCameraController::enter_mode(PanMode next, const CameraFrameInput& input, bool space) {
    if (next == PanMode::Idle) {
        leave_to_idle(mode_, space);
        return;
    }

    if (mode_ == PanMode::Idle) {
        saved_cursor_locked_ = cursor_ ? cursor_->is_locked() : false;
        anchor_x_ = input.pointer_x;
        anchor_y_ = input.pointer_y;
        lock_cursor(true);
    }

    idle_.abort();
    cancel_alignment();

    mode_ = next;
    if (next == PanMode::SecondaryFreeLook) {
        free_look_offset_ = math::wrap_degrees(yaw_ - behind_yaw(up_.current()));
    } else {
        free_look_offset_ = 0.0f;
    }
}

void OrbitCameraController::leave_to_idle(PanMode from, bool space) {
    mode_ = PanMode::Idle;
    lock_cursor(saved_cursor_locked_);

    if (space) {
        if (space_pan_ && orientation_) orientation_->freeze_up(cam_up_);
        space_pan_ = false;
        return;
    }

    if (cursor_ && !saved_cursor_locked_) cursor_->warp(anchor_x_, anchor_y_);

    const JPH::Vec3 up = up_.current();
    if (from == PanMode::SecondaryFreeLook) {
        begin_ease(behind_yaw(up) + free_look_offset_, config_.free_look_return_seconds, {});
    } else {
        idle_.start(config_.auto_align_idle_seconds);
    }
}

void OrbitCameraController::update_zoom(const CameraFrameInput& input, float dt, bool accept_scroll) {
    if (accept_scroll && input.scroll != 0.0f && !input.pointer_over_ui) {
        float step = input.scroll > 0.0f ? -1.0f / static_cast<float>(std::max(1, config_.zoom_in_ticks))
                                         :  1.0f / static_cast<float>(std::max(1, config_.zoom_out_ticks));
        zoom_percent_ = std::clamp(zoom_percent_ + step, 0.0f, 1.0f);
    }
    zoom_distance_ += (target_zoom_distance() - zoom_distance_) * math::exp_blend(config_.zoom_smoothing, dt);
}

void OrbitCameraController::apply_look(const CameraFrameInput& input, float dt, bool space) {
    const bool mouse_look = first_person_ && mode_ == PanMode::Idle;
    if (mode_ != PanMode::PrimaryOrbit && mode_ != PanMode::SecondaryFreeLook && !mouse_look) return;

    const float d_yaw   = input.pointer_dx * config_.pan_sensitivity * dt;
    const float d_pitch = input.pointer_dy * config_.pan_sensitivity * dt;

    if (mouse_look && (d_yaw != 0.0f || d_pitch != 0.0f)) {
        idle_.abort();
        cancel_alignment();
    }

    if (space) {
        begin_space_pan();
        space_yaw_   += d_yaw;
        space_pitch_ += d_pitch;
        return;
    }
    yaw_   = math::wrap_degrees(yaw_ + d_yaw);
    pitch_ = std::clamp(pitch_ + d_pitch, -config_.max_pitch_deg, config_.max_pitch_deg);
}

// ---------------------------------------------------------------------------
// Alignment
// ---------------------------------------------------------------------------

void OrbitCameraController::advance_alignment(float dt, JPH::Vec3Arg up) {
    if (idle_.advance(dt)) begin_ease(behind_yaw(up), config_.auto_align_seconds, {});

    if (!align_.active()) return;

    float eased = align_.advance(dt);
    yaw_ = math::wrap_degrees(math::lerp_angle(align_from_, align_to_, eased));
    if (align_.active()) return;

    yaw_ = align_to_;
    auto done = std::move(align_done_);
    align_done_ = nullptr;
    if (done) done();
}

void OrbitCameraController::begin_ease(float target_yaw, float duration, std::function<void()> on_complete) {
    cancel_alignment();
    align_from_ = yaw_;
    align_to_   = math::wrap_degrees(target_yaw);
    align_done_ = std::move(on_complete);
    align_.start(duration);
}

void OrbitCameraController::cancel_alignment() {
    align_.abort();
    align_done_ = nullptr;
}

void OrbitCameraController::start_auto_align_behind_character(float duration,
                                                               std::function<void()> on_complete) {
    const JPH::Vec3 up = up_.current();
    if (math::is_degenerate(math::horizontal_direction(character_forward(), up))) {
        cancel_alignment();
        if (on_complete) on_complete();
        return;
    }
    idle_.abort();
    begin_ease(behind_yaw(up), duration > 0.0f ? duration : config_.auto_align_seconds,
               std::move(on_complete));
}

// ---------------------------------------------------------------------------
// Pose
// ---------------------------------------------------------------------------

void OrbitCameraController::begin_space_pan() {
    if (space_pan_) return;
    space_pan_     = true;
    space_forward_ = forward_;
    space_up_      = cam_up_;
    space_yaw_     = 0.0f;
    space_pitch_   = 0.0f;
}

void OrbitCameraController::build_rotation(JPH::Vec3Arg up, bool space) {
    if (space) {
        const bool rotating = mode_ == PanMode::PrimaryOrbit || mode_ == PanMode::SecondaryFreeLook ||
                              (first_person_ && mode_ == PanMode::Idle);
        if (!rotating) return;

        begin_space_pan();

        JPH::Quat q_yaw   = JPH::Quat::sRotation(space_up_, -space_yaw_ * math::kDegToRad);
        JPH::Vec3 yaw_fwd = q_yaw * space_forward_;
        JPH::Vec3 axis    = math::right_of(yaw_fwd, space_up_).NormalizedOr(right_);
        JPH::Quat q       = JPH::Quat::sRotation(axis, space_pitch_ * math::kDegToRad) * q_yaw;

        forward_  = (q * space_forward_).Normalized();
        cam_up_   = (q * space_up_).Normalized();
        right_    = math::right_of(forward_, cam_up_).NormalizedOr(right_);
        rotation_ = math::look_rotation(forward_, cam_up_);
        return;
    }

    JPH::Vec3 fwd   = math::forward_from_yaw_pitch(math::reference_forward(up), up, yaw_, pitch_);
    JPH::Vec3 right = math::right_of(fwd, up);
    right = math::is_degenerate(right) ? right_ : right.Normalized();

    forward_  = fwd;
    right_    = right;
    cam_up_   = right.Cross(fwd).Normalized();
    rotation_ = math::look_rotation(forward_, cam_up_);
}

void OrbitCameraController::place(const CameraFrameInput& input) {
    pivot_ = input.character.position + input.character.rotation * config_.target_offset;
    JPH::Vec3 desired = pivot_ - forward_ * zoom_distance_ + offsets_.consume();

    if (!query_) {
        position_ = desired;
        return;
    }

    CameraCollisionSettings settings;
    settings.min_distance      = config_.min_zoom + 0.2f;
    settings.buffer            = config_.collision_buffer;
    settings.probe_radius      = config_.probe_radius;
    settings.ring_quality      = config_.collision_quality;
    settings.ring_min_distance = config_.ring_min_distance;
    settings.filter.layer_mask = first_person_ ? (collision_mask_ & ~QueryLayers::Character) : collision_mask_;
    settings.filter.ignore     = input.character.body;

    position_ = resolve_camera_collision(*query_, pivot_, desired, up_.current(), settings);
}

void OrbitCameraController::reseat_on_forward(JPH::Vec3Arg up) {
    if (!math::is_degenerate(math::project_on_plane(forward_, up))) {
        const float yaw   = math::wrap_degrees(math::signed_yaw(math::reference_forward(up), forward_, up));
        const float delta = math::wrap_degrees(yaw - yaw_);
        if (align_.active()) {
            align_from_ = math::wrap_degrees(align_from_ + delta);
            align_to_   = math::wrap_degrees(align_to_ + delta);
        }
        yaw_ = yaw;
    }
    pitch_ = std::clamp(math::elevation(forward_, up), -config_.max_pitch_deg, config_.max_pitch_deg);
}

void OrbitCameraController::update_first_person() {
    set_first_person(zoom_distance_ <= config_.min_zoom + config_.first_person_margin);
}

void OrbitCameraController::set_first_person(bool fp) {
    if (fp == first_person_) return;

    first_person_ = fp;
    if (mode_ == PanMode::Idle) lock_cursor(fp);
    std::cout << "[Camera] " << (fp ? "First" : "Third") << " person" << std::endl;
    if (first_person_listener_) first_person_listener_(fp);
}

// ---------------------------------------------------------------------------
// Ability mutators
// ---------------------------------------------------------------------------

void OrbitCameraController::set_panning_active(bool active, bool force) {
    if (active) {
        if (mode_ == PanMode::ExternallyDriven) return;
        if (mode_ == PanMode::Idle) {
            saved_cursor_locked_ = cursor_ ? cursor_->is_locked() : false;
            anchor_x_ = pointer_x_;
            anchor_y_ = pointer_y_;
        }
        mode_ = PanMode::ExternallyDriven;
        lock_cursor(true);
        idle_.abort();
        cancel_alignment();
        stabilize_.abort();
        return;
    }

    if (mode_ != PanMode::ExternallyDriven && !force) return;

    if (force) {
        primary_down_   = false;
        secondary_down_ = false;
    } else {
        PanMode held = held_mode();
        if (held != PanMode::Idle) {
            mode_ = held;
            if (held == PanMode::SecondaryFreeLook) {
                free_look_offset_ = math::wrap_degrees(yaw_ - behind_yaw(up_.current()));
            }
            return;
        }
    }

    if (mode_ == PanMode::Idle) return;
    leave_to_idle(mode_, read_frame().unconstrained);
}

void OrbitCameraController::force_orientation_update(JPH::Vec3Arg up) {
    const JPH::Vec3 clean = sanitize_up(up, up_.current());
    up_.reset(clean);

    JPH::Vec3 flat = math::horizontal_direction(forward_, clean);
    if (math::is_degenerate(flat)) flat = math::reference_forward(clean);

    yaw_      = math::wrap_degrees(math::signed_yaw(math::reference_forward(clean), flat, clean));
    pitch_    = 0.0f;
    forward_  = flat;
    right_    = math::right_of(flat, clean).Normalized();
    cam_up_   = clean;
    rotation_ = math::look_rotation(forward_, cam_up_);
    space_pan_ = false;

    std::cout << "[Camera] Orientation forced, up (" << clean.GetX() << ", " << clean.GetY()
              << ", " << clean.GetZ() << ")" << std::endl;
}

void OrbitCameraController::set_collision_mask_phase_ignore(bool ignore) {
    if (ignore == phase_ignored_) return;
    if (ignore) {
        saved_mask_     = collision_mask_;
        collision_mask_ = collision_mask_ & ~QueryLayers::Phase;
    } else {
        collision_mask_ = saved_mask_;
    }
    phase_ignored_ = ignore;
}

// ---------------------------------------------------------------------------
// Gravity transitions
// ---------------------------------------------------------------------------

void OrbitCameraController::on_gravity_transition_started() {
    transition_open_    = true;
    transition_prev_up_ = up_.current();
    transition_forward_ = forward_;
    transition_right_   = right_;
    transition_yaw_     = yaw_;
}

void OrbitCameraController::on_gravity_transition_completed() {
    const OrientationFrame frame = read_frame();
    const JPH::Vec3 old_up = transition_open_ ? transition_prev_up_ : up_.current();
    const JPH::Vec3 new_up = frame.up;
    transition_open_ = false;

    if (UpTracker::is_same_up(old_up, new_up)) return;

    up_.reset(new_up);
    was_space_ = frame.unconstrained;
    idle_.abort();
    cancel_alignment();

    const float dot = old_up.Dot(new_up);
    if (dot < config_.significant_change_dot) {
        // Large flip: the old seat is meaningless, go behind the character.
        JPH::Vec3 flat = math::horizontal_direction(character_forward(), new_up);
        if (!math::is_degenerate(flat)) {
            yaw_ = math::wrap_degrees(math::signed_yaw(math::reference_forward(new_up), flat, new_up));
        }
        pitch_ = std::clamp(config_.transition_pitch_deg, -config_.max_pitch_deg, config_.max_pitch_deg);
        std::cout << "[Camera] Significant gravity change (dot " << dot << "), behind character" << std::endl;
    } else {
        // Keep the camera in the same seat relative to the character.
        JPH::Vec3 orbital = position_ - pivot_;
        if (math::is_degenerate(orbital)) orbital = -transition_forward_ * std::max(zoom_distance_, 1.0f);

        JPH::Vec3 look = -(JPH::Quat::sFromTo(old_up, new_up) * orbital);
        if (!math::is_degenerate(math::project_on_plane(look, new_up))) {
            yaw_ = math::wrap_degrees(math::signed_yaw(math::reference_forward(new_up), look, new_up));
        } else {
            yaw_ = transition_yaw_;
        }
        pitch_ = std::clamp(math::elevation(look, new_up), -config_.max_pitch_deg, config_.max_pitch_deg);
    }

    stabilize_.start(config_.stabilization_seconds);
    if (!frame.unconstrained) build_rotation(new_up, false);
}

} // namespace gravity
