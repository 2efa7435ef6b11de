#pragma once
#include "ground_probe.hpp"
#include "timers.hpp"
#include <Jolt/Jolt.h>
#include <Jolt/Math/Vec3.h>
#include <functional>
#include <memory>
#include <vector>

namespace gravity {

struct LocomotionConfig {
    float move_speed                    = 8.0f;
    float min_move_speed                = 0.1f;
    float ground_accel                  = 15.0f;
    float air_accel                     = 5.0f;
    float ground_friction_damp          = 10.0f;
    float slide_accel                   = 30.0f;
    float slide_max_speed               = 14.0f;
    float post_jump_move_lock_seconds   = 0.18f;
    float external_hold_default_seconds = 0.35f;
    float realign_seconds               = 0.35f;
};

struct MoveInput {
    float x       = 0.0f;   // strafe, positive = right
    float y       = 0.0f;   // positive = forward
    bool  autorun = false;  // both orbit buttons held
};

// Camera basis used to map input. forward/right are world vectors; they are
// flattened onto the plane perpendicular to up before use.
struct CameraBasis {
    JPH::Vec3 forward   = JPH::Vec3::sAxisZ();
    JPH::Vec3 right     = -JPH::Vec3::sAxisX();
    bool      free_look = false;
    bool      aligning  = false;   // camera is easing back behind the character
};

// ---------------------------------------------------------------------------
// LocomotionResolver
//
// Turns input, camera basis and ground contact into a body velocity, with
// every "horizontal" measured against the current up.
//
//   update_input()  variable rate; resolves the world move direction
//   resolve()       fixed rate; returns the new velocity
//
// On an unwalkable contact input is ignored and the body accelerates
// downhill up to slide_max_speed. Otherwise, in priority order: external
// stop, external hold, post-jump lockout, idle damping, approach to
// move_direction * current_move_speed.
// ---------------------------------------------------------------------------

class LocomotionResolver {
public:
    // Asks the camera to swing behind the character; on_complete fires when done.
    using RealignRequest = std::function<void(float seconds, std::function<void()> on_complete)>;

    explicit LocomotionResolver(LocomotionConfig config = {});

    void set_config(const LocomotionConfig& config) { config_ = config; }
    const LocomotionConfig& config() const { return config_; }
    void set_realign_request(RealignRequest request) { realign_request_ = std::move(request); }

    void update_input(const MoveInput& input, const CameraBasis& camera,
                      JPH::Vec3Arg up, JPH::Vec3Arg character_forward);

    JPH::Vec3 resolve(JPH::Vec3Arg velocity, const GroundContact& contact,
                      JPH::Vec3Arg up, float dt);

    bool      is_grounded()        const { return grounded_; }
    bool      is_sliding()         const { return sliding_; }
    bool      has_movement_input() const { return has_input_; }
    JPH::Vec3 move_direction()     const { return move_dir_; }
    float     horizontal_speed()   const { return horizontal_speed_; }

    void hold_external_horizontal(JPH::Vec3Arg world_velocity, float seconds);
    void cancel_external_horizontal_hold();
    bool is_holding_external() const { return hold_.active(); }

    void set_external_stop_movement(bool stop) { external_stop_ = stop; }
    bool is_externally_stopped() const { return external_stop_; }

    void notify_jumped();
    bool in_jump_lockout() const { return lockout_.active(); }

    float current_move_speed() const;
    void  add_speed_modifier(float modifier) { speed_modifiers_.push_back(modifier); }
    void  remove_speed_modifier(float modifier);

    bool is_free_look_locked()    const { return free_look_locked_; }
    bool is_waiting_for_realign() const { return waiting_realign_; }

    void reset();

    // World direction for input axes through a flattened basis; zero when idle.
    static JPH::Vec3 map_input(float x, float y, JPH::Vec3Arg forward, JPH::Vec3Arg right);

private:
    void capture_locked_basis(const CameraBasis& camera, JPH::Vec3Arg up,
                              JPH::Vec3Arg character_forward);

    LocomotionConfig config_;
    RealignRequest   realign_request_;
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);

    JPH::Vec3 move_dir_         = JPH::Vec3::sZero();
    JPH::Vec3 last_up_          = JPH::Vec3::sAxisY();
    bool      has_input_        = false;
    bool      grounded_         = false;
    bool      sliding_          = false;
    float     horizontal_speed_ = 0.0f;

    // Free-look keeps mapping input through the basis captured at entry.
    bool      free_look_locked_ = false;
    bool      waiting_realign_  = false;
    bool      was_free_look_    = false;
    JPH::Vec3 locked_forward_   = JPH::Vec3::sAxisZ();
    JPH::Vec3 locked_right_     = -JPH::Vec3::sAxisX();
    JPH::Vec3 locked_move_      = JPH::Vec3::sZero();

    bool           external_stop_ = false;
    JPH::Vec3      held_velocity_ = JPH::Vec3::sZero();
    CountdownTimer hold_;
    CountdownTimer lockout_;

    std::vector<float> speed_modifiers_;
};

} // namespace gravity
