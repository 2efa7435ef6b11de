#pragma once
#include <ecs/ecs.hpp>

// Translates PlayerInput + camera view directions into a world-space CharacterIntent
// through the character's LocomotionResolver, measured against the current up.
// Runs in the Logic phase, after CameraSystem has written MainCamera.
class CharacterInputSystem {
public:
    static void Register(ecs::World& world);
    static void Update(ecs::World& world, float dt);
};
