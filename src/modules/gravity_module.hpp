#pragma once
#include "../components.hpp"
#include "../debug_panel.hpp"
#include "../pipeline.hpp"
#include "../tuning.hpp"
#include "../systems/gravity.hpp"
#include "../core/gravity_field.hpp"
#include <ecs/ecs.hpp>
#include <cstdio>
#include <memory>
#include <string>

// ---------------------------------------------------------------------------
// GravityModule
//
// Creates the GravityField world resource (the OrientationSource everything
// else reads), registers the zone id hook, and adds GravitySystem as the
// first Physics-phase step. Adds "Gravity" debug rows.
//
// GravitySystem sends GravityChangedEvent when EventBusModule is installed.
// Install before CameraModule (which listens to the field for transitions)
// and before CharacterModule.
// ---------------------------------------------------------------------------

struct GravityModule {
    static void install(ecs::World& world, ecs::Pipeline& pipeline) {
        auto field = std::make_shared<gravity::GravityField>();
        if (auto* tuning = world.try_resource<TuningConfig>()) field->set_config(tuning->field);
        world.set_resource(field);

        GravitySystem::Register(world);
        pipeline.add_physics([](ecs::World& w, float dt) { GravitySystem::Update(w, dt); });

        if (auto* panel = world.try_resource<DebugPanel>()) {
            panel->watch("Gravity", "Zone", [&world]() {
                auto* f = world.try_resource<std::shared_ptr<gravity::GravityField>>();
                if (!f || !*f) return std::string("-");
                std::uint32_t zone = (*f)->active_zone();
                return zone == gravity::GravityField::kNoZone ? std::string("none (zero-g)")
                                                              : std::to_string(zone);
            });
            panel->watch("Gravity", "Up", [&world]() {
                auto* f = world.try_resource<std::shared_ptr<gravity::GravityField>>();
                if (!f || !*f) return std::string("-");
                JPH::Vec3 up = (*f)->frame().up;
                char b[48];
                std::snprintf(b, sizeof(b), "%.2f %.2f %.2f", up.GetX(), up.GetY(), up.GetZ());
                return std::string(b);
            });
            panel->watch("Gravity", "Transitions", [&world]() {
                auto* f = world.try_resource<std::shared_ptr<gravity::GravityField>>();
                if (!f || !*f) return std::string("-");
                return std::to_string((*f)->transition_count());
            });
        }
    }

    // Pushes TuningConfig::field into the field (after a scene load).
    static void apply_tuning(ecs::World& world) {
        auto* f = world.try_resource<std::shared_ptr<gravity::GravityField>>();
        auto* tuning = world.try_resource<TuningConfig>();
        if (!f || !*f || !tuning) return;
        (*f)->set_config(tuning->field);
    }
};
