#pragma once
#include <ecs/ecs.hpp>

// Maps the InputRecord onto the player's PlayerInput (move axes, jump, autorun
// and the camera ability keys). Pre-Update, after InputGatherSystem.
class PlayerInputSystem {
public:
    static void Update(ecs::World& world);
};
