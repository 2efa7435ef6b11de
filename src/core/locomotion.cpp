#include "locomotion.hpp"
#include "../math_util.hpp"
#include <algorithm>
#include <cmath>

namespace gravity {

LocomotionResolver::LocomotionResolver(LocomotionConfig config) : config_(config) {}

JPH::Vec3 LocomotionResolver::map_input(float x, float y, JPH::Vec3Arg forward, JPH::Vec3Arg right) {
    float magnitude = std::min(1.0f, std::sqrt(x * x + y * y));
    if (magnitude < 0.1f) return JPH::Vec3::sZero();
    JPH::Vec3 dir = forward * y + right * x;
    return math::safe_normalized(dir, JPH::Vec3::sZero()) * magnitude;
}

void LocomotionResolver::capture_locked_basis(const CameraBasis& camera, JPH::Vec3Arg up,
                                              JPH::Vec3Arg character_forward) {
    JPH::Vec3 fwd = math::horizontal_direction(camera.forward, up);
    if (math::is_degenerate(fwd)) fwd = math::horizontal_direction(character_forward, up);
    if (math::is_degenerate(fwd)) fwd = math::reference_forward(up);
    locked_forward_   = fwd;
    locked_right_     = math::right_of(fwd, up).Normalized();
    locked_move_      = JPH::Vec3::sZero();
    free_look_locked_ = true;
}

void LocomotionResolver::update_input(const MoveInput& input, const CameraBasis& camera,
                                      JPH::Vec3Arg up, JPH::Vec3Arg character_forward) {
    float x = input.x;
    float y = input.y;

    if (input.autorun) {
        x = 0.0f;
        y = 1.0f;
        free_look_locked_ = false;
        waiting_realign_  = false;
    }
    if (external_stop_) {
        x = 0.0f;
        y = 0.0f;
    }

    const bool free_look = camera.free_look && !input.autorun;
    const bool moving    = x * x + y * y >= 0.01f;
    if (free_look && !was_free_look_) {
        capture_locked_basis(camera, up, character_forward);
        waiting_realign_ = false;
    }

    if (was_free_look_ && !free_look) {
        // Free-look released while moving: hold the locked heading until the
        // camera has swung back behind the character.
        if (free_look_locked_ && moving && realign_request_) {
            if (math::is_degenerate(locked_move_)) {
                locked_move_ = map_input(x, y, locked_forward_, locked_right_);
            }
            waiting_realign_ = true;
            std::weak_ptr<bool> alive = alive_;
            realign_request_(config_.realign_seconds, [this, alive]() {
                if (alive.lock()) waiting_realign_ = false;
            });
        }
        free_look_locked_ = false;
    } else if (waiting_realign_ && (!camera.aligning || !moving)) {
        // The camera dropped the realign (replaced or aborted) or the stick
        // was let go.
        waiting_realign_ = false;
    }

    if (waiting_realign_) {
        move_dir_ = locked_move_;
    } else if (free_look_locked_ && free_look) {
        move_dir_ = map_input(x, y, locked_forward_, locked_right_);
        if (!math::is_degenerate(move_dir_)) locked_move_ = move_dir_;
    } else {
        JPH::Vec3 fwd = math::horizontal_direction(camera.forward, up);
        if (math::is_degenerate(fwd)) fwd = math::horizontal_direction(character_forward, up);
        if (math::is_degenerate(fwd)) fwd = math::reference_forward(up);
        JPH::Vec3 right = math::horizontal_direction(camera.right, up);
        if (math::is_degenerate(right)) right = math::right_of(fwd, up).Normalized();
        move_dir_ = map_input(x, y, fwd, right);
    }

    has_input_ = move_dir_.LengthSq() > 0.01f;

    if (!has_input_) waiting_realign_ = false;
    was_free_look_ = free_look;
}

JPH::Vec3 LocomotionResolver::resolve(JPH::Vec3Arg velocity, const GroundContact& contact,
                                      JPH::Vec3Arg up, float dt) {
    last_up_ = up;
    hold_.advance(dt);
    lockout_.advance(dt);

    grounded_ = contact.walkable && !lockout_.active();
    sliding_  = contact.is_sliding();

    JPH::Vec3 v = velocity;

    // --- Slide: input has no effect, orientation is left alone ---
    if (sliding_) {
        JPH::Vec3 downhill = math::safe_normalized(math::project_on_plane(-up, contact.normal), -up);

        float uphill = -v.Dot(downhill);
        if (uphill > 0.0f) v += downhill * uphill;

        v += downhill * (config_.slide_accel * dt);

        float along = v.Dot(downhill);
        if (along > config_.slide_max_speed) v -= downhill * (along - config_.slide_max_speed);

        horizontal_speed_ = math::project_on_plane(v, up).Length();
        return v;
    }

    JPH::Vec3 vertical   = up * v.Dot(up);
    JPH::Vec3 horizontal = v - vertical;

    if (external_stop_) {
        horizontal = JPH::Vec3::sZero();
    } else if (hold_.active()) {
        horizontal = held_velocity_;
    } else if (lockout_.active()) {
        // Leave the launch velocity untouched.
    } else if (!has_input_) {
        if (grounded_) horizontal *= std::exp(-config_.ground_friction_damp * dt);
    } else {
        float     accel  = grounded_ ? config_.ground_accel : config_.air_accel;
        JPH::Vec3 target = move_dir_ * current_move_speed();
        horizontal += (target - horizontal) * math::exp_blend(accel, dt);
    }

    // Grounded bodies carry no velocity along up; the motor adds gravity otherwise.
    if (grounded_) vertical = JPH::Vec3::sZero();

    horizontal_speed_ = horizontal.Length();
    return vertical + horizontal;
}

void LocomotionResolver::hold_external_horizontal(JPH::Vec3Arg world_velocity, float seconds) {
    held_velocity_ = math::project_on_plane(world_velocity, last_up_);
    float duration = seconds > 0.0f ? seconds : config_.external_hold_default_seconds;
    if (held_velocity_.LengthSq() > 0.0001f && duration > 0.0f) {
        hold_.start(duration);
    } else {
        cancel_external_horizontal_hold();
    }
}

void LocomotionResolver::cancel_external_horizontal_hold() {
    hold_.abort();
    held_velocity_ = JPH::Vec3::sZero();
}

void LocomotionResolver::notify_jumped() {
    lockout_.start(config_.post_jump_move_lock_seconds);
    grounded_ = false;
}

float LocomotionResolver::current_move_speed() const {
    float total = config_.move_speed;
    for (float m : speed_modifiers_) total += m;
    return std::max(config_.min_move_speed, total);
}

void LocomotionResolver::remove_speed_modifier(float modifier) {
    auto it = std::find(speed_modifiers_.begin(), speed_modifiers_.end(), modifier);
    if (it != speed_modifiers_.end()) speed_modifiers_.erase(it);
}

void LocomotionResolver::reset() {
    move_dir_         = JPH::Vec3::sZero();
    has_input_        = false;
    grounded_         = false;
    sliding_          = false;
    horizontal_speed_ = 0.0f;
    free_look_locked_ = false;
    waiting_realign_  = false;
    was_free_look_    = false;
    locked_move_      = JPH::Vec3::sZero();
    external_stop_    = false;
    cancel_external_horizontal_hold();
    lockout_.abort();
    speed_modifiers_.clear();
}

} // namespace gravity
