#pragma once
#include <ecs/ecs.hpp>

// Applies the LocomotionResolver's velocity + CharacterState to Jolt: up
// alignment, jump along up, gravity from the field, ExtendedUpdate, and
// transform sync back to ECS.
// Fixed Physics phase, after CharacterStateSystem and before PhysicsSystem.
class CharacterMotorSystem {
public:
    static void Register(ecs::World& world);
    static void Update(ecs::World& world, float dt);
};
