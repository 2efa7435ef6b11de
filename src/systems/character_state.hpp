#pragma once
#include <ecs/ecs.hpp>
#include "../components.hpp"

// Owns the character state machine: ground detection, coyote time, jump eligibility.
// Runs first in the fixed Physics phase after GravitySystem, so the motor sees
// this step's contact and jump impulse.
class CharacterStateSystem {
public:
    static void Register(ecs::World& world);
    static void Update(ecs::World& world, float dt);

    // Pure state transition - no Jolt dependency. Exposed for unit testing.
    // on_ground: the ground probe reported walkable contact this step.
    // No jump fires while state.jump_suppression is held.
    static void apply_state(bool on_ground, float dt,
                            const CharacterIntent& intent, CharacterState& state);
};
