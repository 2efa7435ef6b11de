#include "scene.hpp"
#include "pipeline.hpp"
#include "tuning.hpp"
#include "modules/camera_module.hpp"
#include "modules/character_module.hpp"
#include "modules/debug_module.hpp"
#include "modules/event_bus_module.hpp"
#include "modules/gravity_module.hpp"
#include "modules/input_module.hpp"
#include "modules/physics_module.hpp"
#include "modules/render_module.hpp"
#include <ecs/ecs.hpp>
#include <raylib.h>
#include <iostream>

static const char* SCENE_PATH = "resources/scenes/default.json";

static void load_scene(ecs::World& world) {
    if (!SceneLoader::load(world, SCENE_PATH)) {
        std::cerr << "[Main] Scene load failed: " << SCENE_PATH << std::endl;
    }
    CameraSystem::ApplyTuning(world);
    GravityModule::apply_tuning(world);
}

int main() {
  InitWindow(1280, 720, "Gravity Orbit - Walls, Slopes and Planetoids");
  SetTargetFPS(60);

  ecs::World    world;
  ecs::Pipeline pipeline;

  // Scene tuning lands here; the modules read it when they install.
  world.set_resource(TuningConfig{});

  // --- Module installation (order matters) ---
  EventBusModule::install(world, pipeline);
  RenderModule::install(world, pipeline);
  DebugModule::install(world, pipeline);
  InputModule::install(world, pipeline);

  PhysicsModule::install(world, pipeline);
  GravityModule::install(world, pipeline);
  CameraModule::install(world, pipeline);
  CharacterModule::install(world, pipeline);
  PhysicsModule::install_step(world, pipeline);

  load_scene(world);

  // --- Main Loop ---
  while (!WindowShouldClose()) {
    float dt = GetFrameTime();

    if (IsKeyPressed(KEY_R)) {
        SceneLoader::unload(world);
        load_scene(world);
    }

    // 1. Update Logic & Input
    pipeline.update(world, dt);

    // 2. Step Physics (Fixed Timestep)
    pipeline.advance(world, dt);

    // 3. Render
    BeginDrawing();
    pipeline.render(world);
    EndDrawing();
  }

  SceneLoader::unload(world);
  CloseWindow();
  return 0;
}
