#include "camera.hpp"
#include "../components.hpp"
#include "../debug_panel.hpp"
#include "../input_state.hpp"
#include "../math_util.hpp"
#include "../physics_handles.hpp"
#include "../tuning.hpp"
#include "../core/orbit_camera.hpp"
#include "../core/speed_state.hpp"
#include <raylib.h>
#include <memory>

using namespace ecs;

static gravity::ButtonState button_state(const ButtonSample& sample) {
    gravity::ButtonState s;
    s.pressed  = sample.pressed;
    s.held     = sample.down;
    s.released = sample.released;
    return s;
}

bool RaylibCursorControl::is_locked() const {
    return IsCursorHidden();
}

void RaylibCursorControl::set_locked(bool locked) {
    if (locked == IsCursorHidden()) return;
    if (locked) DisableCursor();
    else        EnableCursor();
}

void RaylibCursorControl::warp(float x, float y) {
    SetMousePosition(static_cast<int>(x), static_cast<int>(y));
}

void CameraSystem::ApplyTuning(World& world) {
    auto* ctrl = world.try_resource<std::shared_ptr<gravity::OrbitCameraController>>();
    auto* tuning = world.try_resource<TuningConfig>();
    if (!ctrl || !*ctrl || !tuning) return;
    (*ctrl)->set_config(tuning->camera);
    (*ctrl)->reset();
}

void CameraSystem::Update(World& world, float dt) {
    // 1. Get Resources
    auto* input_ptr = world.try_resource<InputRecord>();
    auto* ctrl_ptr  = world.try_resource<std::shared_ptr<gravity::OrbitCameraController>>();
    auto* cam_ptr   = world.try_resource<MainCamera>();
    if (!input_ptr || !ctrl_ptr || !*ctrl_ptr || !cam_ptr) return;
    const auto& record = *input_ptr;
    auto& ctrl = **ctrl_ptr;
    MainCamera& cam = *cam_ptr;

    // 2. Frame input
    gravity::CameraFrameInput frame;
    frame.pointer_dx = record.pointer_delta.x;
    frame.pointer_dy = -record.pointer_delta.y;   // screen y grows downward
    frame.pointer_x  = record.pointer.x;
    frame.pointer_y  = record.pointer.y;
    frame.scroll     = record.wheel;
    frame.primary    = button_state(record.orbit);
    frame.secondary  = button_state(record.free_look);

    if (auto* panel = world.try_resource<DebugPanel>()) {
        frame.pointer_over_ui = panel->contains(record.pointer.x, record.pointer.y);
    }

    bool has_player = false;
    world.single<PlayerTag, CharacterHandle>([&](Entity, PlayerTag&, CharacterHandle& h) {
        frame.character.position = h.character->GetPosition();
        frame.character.rotation = h.character->GetRotation();
        has_player = true;
    });
    if (!has_player) return;

    // 3. Camera keys
    world.single<PlayerTag, PlayerInput>([&](Entity, PlayerTag&, PlayerInput& input) {
        if (input.reset_camera) ctrl.reset();
        if (input.toggle_camera_hold) {
            ctrl.set_panning_active(ctrl.pan_mode() != gravity::PanMode::ExternallyDriven);
        }
        if (input.toggle_phase_view) {
            bool ignoring = (ctrl.collision_mask() & gravity::QueryLayers::Phase) == 0;
            ctrl.set_collision_mask_phase_ignore(!ignoring);
        }
    });

    ctrl.update(frame, dt);

    // 4. Publish
    JPH::Vec3 pos = ctrl.camera_position();
    JPH::Vec3 fwd = ctrl.camera_forward();
    cam.position     = MathBridge::FromJolt(pos);
    cam.target       = MathBridge::FromJolt(pos + fwd);
    cam.up           = MathBridge::FromJolt(ctrl.camera_up());
    cam.view_forward = MathBridge::FromJolt(fwd);
    cam.view_right   = MathBridge::FromJolt(ctrl.camera_right());
    cam.free_look    = ctrl.is_free_look_only_active();
    cam.aligning     = ctrl.is_auto_aligning();
    cam.panning      = ctrl.is_panning_active();
    cam.first_person = ctrl.is_in_first_person();

    // 5. Boost widens the view
    bool boosted = false;
    if (auto* speed = world.try_resource<std::shared_ptr<gravity::SpeedStateProvider>>()) {
        boosted = *speed && (*speed)->is_boosted();
    }
    float target_fov = boosted ? cam.boost_fovy : cam.base_fovy;
    cam.fovy += (target_fov - cam.fovy) * gravity::math::exp_blend(6.0f, dt);
}
