#pragma once
#include "../debug_panel.hpp"
#include "../physics_context.hpp"
#include "../pipeline.hpp"
#include "../systems/debug.hpp"
#include <ecs/ecs.hpp>
#include <raylib.h>
#include <cstdio>
#include <memory>
#include <string>

// ---------------------------------------------------------------------------
// DebugModule
//
// Creates the DebugPanel world resource, registers Engine-level debug rows
// (frame rate, fixed steps taken this frame, entity and body counts), and
// adds DebugSystem to the Render phase. RenderModule must already be
// installed so the overlay draws last. The panel's drawn bounds feed
// CameraFrameInput::pointer_over_ui.
//
// Must be installed BEFORE any game module that wants to add its own debug
// rows, so that the DebugPanel resource exists when those modules call
// world.try_resource<DebugPanel>()->watch(...).
// ---------------------------------------------------------------------------

struct DebugModule {
    static void install(ecs::World& world, ecs::Pipeline& pipeline) {
        DebugPanel panel;

        panel.watch("Engine", "FPS", []() {
            char b[24];
            std::snprintf(b, sizeof(b), "%d (%d ms)", GetFPS(), (int)(GetFrameTime() * 1000));
            return std::string(b);
        });
        panel.watch("Engine", "Fixed Steps", [&pipeline]() {
            char b[32];
            std::snprintf(b, sizeof(b), "%d @ %.0f Hz", pipeline.last_steps(), 1.0f / pipeline.fixed_dt());
            return std::string(b);
        });
        panel.watch("Engine", "Entities", [&world]() {
            return std::to_string(world.count());
        });
        panel.watch("Engine", "Bodies", [&world]() {
            auto* ctx = world.try_resource<std::shared_ptr<PhysicsContext>>();
            if (!ctx || !*ctx) return std::string("-");
            return std::to_string((*ctx)->physics_system->GetNumBodies());
        });

        world.set_resource(std::move(panel));
        pipeline.add_render([](ecs::World& w, float dt) { DebugSystem::Update(w, dt); });
    }
};
