#pragma once
#include "../components.hpp"
#include "../debug_panel.hpp"
#include "../events.hpp"
#include "../physics_handles.hpp"
#include "../pipeline.hpp"
#include "../systems/character_input.hpp"
#include "../systems/character_motor.hpp"
#include "../systems/character_state.hpp"
#include "../core/speed_state.hpp"
#include <ecs/ecs.hpp>
#include <cstdio>
#include <memory>
#include <string>

// ---------------------------------------------------------------------------
// CharacterModule
//
// Registers lifecycle hooks for the character systems (the motor's hook also
// builds each character's GroundProbe and LocomotionResolver) and publishes
// the SpeedStateProvider the camera widens its view on. JumpEvent and
// LandEvent go to the queues EventBusModule registers.
//
// Ordering:
//   Logic:   CharacterInput            (after CameraSystem)
//   Physics: CharacterState, CharMotor (after GravitySystem, before
//                                        PhysicsModule::install_step)
// ---------------------------------------------------------------------------

struct CharacterModule {
    static void install(ecs::World& world, ecs::Pipeline& pipeline) {
        // Speed state: boosted while the player outruns the threshold.
        auto speed = std::make_shared<gravity::VelocityThresholdSpeedState>();
        world.set_resource(speed);
        world.set_resource(std::shared_ptr<gravity::SpeedStateProvider>(speed));

        // Lifecycle hooks
        CharacterInputSystem::Register(world);
        CharacterStateSystem::Register(world);
        CharacterMotorSystem::Register(world);

        pipeline.add_logic([](ecs::World& w, float dt) { CharacterInputSystem::Update(w, dt); });
        pipeline.add_physics([](ecs::World& w, float dt) { CharacterStateSystem::Update(w, dt); });
        pipeline.add_physics([](ecs::World& w, float dt) { CharacterMotorSystem::Update(w, dt); });

        // Debug rows
        if (auto* panel = world.try_resource<DebugPanel>()) {
            panel->watch("Character", "Mode", [&world]() {
                std::string r = "-";
                world.each<CharacterState>([&](ecs::Entity, CharacterState& s) {
                    switch (s.mode) {
                        case CharacterState::Mode::Grounded: r = "Grounded"; break;
                        case CharacterState::Mode::Airborne: r = "Airborne"; break;
                        case CharacterState::Mode::Sliding:  r = "Sliding";  break;
                    }
                });
                return r;
            });
            panel->watch("Character", "Ground", [&world]() {
                std::string r = "-";
                world.each<LocomotionHandle>([&](ecs::Entity, LocomotionHandle& h) {
                    const gravity::GroundContact& c = h.probe->contact();
                    if (!c.has_hit) { r = "none"; return; }
                    char b[40];
                    std::snprintf(b, sizeof(b), "%.1f deg %s", c.slope_deg,
                                  c.walkable ? "walkable" : "steep");
                    r = b;
                });
                return r;
            });
            panel->watch("Character", "Speed", [&world]() {
                std::string r = "-";
                world.each<LocomotionHandle>([&](ecs::Entity, LocomotionHandle& h) {
                    char b[32];
                    std::snprintf(b, sizeof(b), "%.1f m/s", h.locomotion->horizontal_speed());
                    r = b;
                });
                return r;
            });
            panel->watch("Character", "Jump Count", [&world]() {
                std::string r = "-";
                world.each<CharacterState>([&](ecs::Entity, CharacterState& s) {
                    r = std::to_string(s.jump_count);
                });
                return r;
            });
            panel->watch("Character", "Last Jump", [&world]() {
                static std::string last = "-";
                if (auto* q = world.try_resource<Events<JumpEvent>>()) {
                    for (const auto& ev : q->read()) {
                        char b[32];
                        std::snprintf(b, sizeof(b), "#%d, %.0f m/s", ev.jump_number, ev.impulse);
                        last = b;
                    }
                }
                return last;
            });
        }
    }
};
