#include "character_state.hpp"
#include "../components.hpp"
#include "../events.hpp"
#include "../physics_handles.hpp"
#include "../core/gravity_field.hpp"
#include <ecs/modules/transform.hpp>

using namespace ecs;

void CharacterStateSystem::Register(World& world) {
    world.on_add<CharacterControllerConfig>(
        [](World& w, Entity e, CharacterControllerConfig&) {
            w.add(e, CharacterState{});
        });
}

void CharacterStateSystem::apply_state(bool on_ground, float dt,
                                       const CharacterIntent& intent,
                                       CharacterState& state) {
    state.jump_impulse = 0.0f;

    if (on_ground) {
        state.mode       = CharacterState::Mode::Grounded;
        state.jump_count = 0;
        state.air_time   = 0.0f;
    } else {
        state.mode      = CharacterState::Mode::Airborne;
        state.air_time += dt;
    }

    if (state.jump_suppression.is_suppressed()) return;

    // Coyote window: first 0.2s of airborne time before any jump has been used
    bool can_coyote = (state.jump_count == 0 && state.air_time < 0.2f);
    bool can_jump   = on_ground || can_coyote || (state.jump_count < 2);

    if (intent.jump_requested && can_jump) {
        state.jump_impulse = (state.jump_count == 0) ? 12.0f : 10.0f;
        // Coyote jump: airborne but first jump - consume it before incrementing
        if (!on_ground && state.jump_count == 0) {
            state.jump_count = 1;
        }
        state.jump_count++;
    }
}

void CharacterStateSystem::Update(World& world, float dt) {
    JPH::Vec3 up = JPH::Vec3::sAxisY();
    if (auto* field = world.try_resource<std::shared_ptr<gravity::GravityField>>()) {
        if (*field) up = (*field)->frame().up;
    }

    auto* jumps = world.try_resource<Events<JumpEvent>>();
    auto* lands = world.try_resource<Events<LandEvent>>();

    world.each<CharacterHandle, LocomotionHandle, CharacterIntent, CharacterState, CharacterControllerConfig>(
        [&](Entity e, CharacterHandle& h, LocomotionHandle& loco, CharacterIntent& intent,
            CharacterState& state, CharacterControllerConfig& cfg) {
            // --- Ground probe against the current up ---
            gravity::ProbeRequest request;
            request.foot_position  = h.character->GetPosition();
            request.up             = up;
            request.capsule_radius = cfg.radius;
            request.capsule_height = cfg.height;
            request.filter.layer_mask &= ~gravity::QueryLayers::Character;
            const gravity::GroundContact& contact = loco.probe->update(request, dt);

            // Sliding and external stops hold one suppression between them.
            bool suppress = contact.is_sliding() || loco.locomotion->is_externally_stopped();
            if (suppress != state.holds_suppression) {
                state.jump_suppression.set_suppressed(suppress);
                state.holds_suppression = suppress;
            }

            const bool  was_grounded = state.mode == CharacterState::Mode::Grounded;
            const float air_time     = state.air_time;
            apply_state(contact.walkable, dt, intent, state);
            intent.jump_requested = false;

            if (contact.is_sliding()) state.mode = CharacterState::Mode::Sliding;

            if (state.jump_impulse > 0.0f) {
                loco.probe->notify_jumped();
                loco.locomotion->notify_jumped();
                if (jumps) jumps->send({e, state.jump_count, state.jump_impulse});
            } else if (!was_grounded && state.mode == CharacterState::Mode::Grounded) {
                if (lands) lands->send({e, air_time});
            }
        });
}
