#pragma once
#include "../debug_panel.hpp"
#include "../input_state.hpp"
#include "../pipeline.hpp"
#include "../systems/input_gather.hpp"
#include "../systems/player_input.hpp"
#include <ecs/ecs.hpp>
#include <raylib.h>
#include <string>

// ---------------------------------------------------------------------------
// InputModule
//
// Creates the InputBindings and InputRecord resources and adds
// InputGatherSystem then PlayerInputSystem to the Pre-Update phase, after the
// EventBus flush. CameraSystem reads the pointer half of InputRecord directly.
// ---------------------------------------------------------------------------

struct InputModule {
    static void install(ecs::World& world, ecs::Pipeline& pipeline) {
        world.set_resource(InputBindings{});
        world.set_resource(InputRecord{});

        pipeline.add_pre_update([](ecs::World& w, float) { InputGatherSystem::Update(w); });
        pipeline.add_pre_update([](ecs::World& w, float) { PlayerInputSystem::Update(w); });

        if (auto* panel = world.try_resource<DebugPanel>()) {
            panel->watch("Input", "Gamepad", [&world]() {
                auto* rec = world.try_resource<InputRecord>();
                if (!rec || rec->gamepad < 0) return std::string("none");
                const char* name = GetGamepadName(rec->gamepad);
                return std::string(name ? name : "unnamed");
            });
        }
    }
};
