#pragma once
#include "../components.hpp"
#include "../pipeline.hpp"
#include "../systems/renderer.hpp"
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// RenderModule
//
// Creates the MainCamera world resource (written by CameraSystem) and adds
// RenderSystem to the Render phase. Install before DebugModule so the
// overlay draws on top. The main loop brackets the Render phase with
// BeginDrawing / EndDrawing.
// ---------------------------------------------------------------------------

struct RenderModule {
    static void install(ecs::World& world, ecs::Pipeline& pipeline) {
        world.set_resource(MainCamera{});
        pipeline.add_render([](ecs::World& w, float) { RenderSystem::Update(w); });
    }
};
