#pragma once
#include <ecs/ecs.hpp>

// Resolves keyboard, mouse and the first real gamepad through InputBindings
// into the InputRecord resource. First Pre-Update step after the event flush;
// nothing else polls Raylib for input.
class InputGatherSystem {
public:
    static void Update(ecs::World& world);
};
