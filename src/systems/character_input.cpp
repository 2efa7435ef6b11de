#include "character_input.hpp"
#include "../components.hpp"
#include "../physics_handles.hpp"
#include "../math_util.hpp"
#include "../core/gravity_field.hpp"

using namespace ecs;

void CharacterInputSystem::Register(World& world) {
    world.on_add<CharacterControllerConfig>(
        [](World& w, Entity e, CharacterControllerConfig&) {
            w.add(e, CharacterIntent{});
        });
}

void CharacterInputSystem::Update(World& world, float /*dt*/) {
    // View directions are owned by MainCamera and written by CameraSystem
    // each Logic tick before this system runs.
    auto* cam = world.try_resource<MainCamera>();
    if (!cam) return;

    JPH::Vec3 up = JPH::Vec3::sAxisY();
    if (auto* field = world.try_resource<std::shared_ptr<gravity::GravityField>>()) {
        if (*field) up = (*field)->frame().up;
    }

    gravity::CameraBasis basis;
    basis.forward   = MathBridge::ToJolt(cam->view_forward);
    basis.right     = MathBridge::ToJolt(cam->view_right);
    basis.free_look = cam->free_look;
    basis.aligning  = cam->aligning;

    world.each<PlayerTag, PlayerInput, CharacterIntent, CharacterHandle, LocomotionHandle>(
        [&](Entity, PlayerTag&, PlayerInput& input, CharacterIntent& intent,
            CharacterHandle& h, LocomotionHandle& loco) {
            JPH::Vec3 character_fwd = h.character->GetRotation() * JPH::Vec3::sAxisZ();

            gravity::MoveInput move;
            move.x       = input.move_input.x;
            move.y       = input.move_input.y;
            move.autorun = input.autorun;
            loco.locomotion->update_input(move, basis, up, character_fwd);

            JPH::Vec3 look = gravity::math::horizontal_direction(basis.forward, up);
            if (gravity::math::is_degenerate(look)) look = gravity::math::horizontal_direction(character_fwd, up);

            intent.move_dir        = MathBridge::FromJolt(loco.locomotion->move_direction());
            intent.look_dir        = MathBridge::FromJolt(look);
            intent.has_input       = loco.locomotion->has_movement_input();
            intent.face_look       = cam->first_person || cam->panning;
            intent.jump_requested |= input.jump;
        });
}
