#pragma once
#include "../components.hpp"
#include "../debug_panel.hpp"
#include "../jolt_spatial_query.hpp"
#include "../pipeline.hpp"
#include "../tuning.hpp"
#include "../systems/camera.hpp"
#include "../core/gravity_field.hpp"
#include "../core/orbit_camera.hpp"
#include <ecs/ecs.hpp>
#include <cstdio>
#include <iostream>
#include <memory>
#include <string>

// ---------------------------------------------------------------------------
// CameraModule
//
// Creates the OrbitCameraController world resource and wires it to its
// collaborators: the GravityField (orientation source + transition
// listener), the JoltSpatialQuery (obstruction checks) and a Raylib cursor.
// First person hides the player's mesh. Adds CameraSystem to the Logic phase
// and registers "Camera" debug rows.
//
// Pipeline placement: CameraSystem MUST be the first Logic-phase step - it
// writes view_forward / view_right to MainCamera, which CharacterInputSystem
// reads immediately after. Install after PhysicsModule and GravityModule and
// before any other Logic-phase game module.
// ---------------------------------------------------------------------------

struct CameraModule {
    static void install(ecs::World& world, ecs::Pipeline& pipeline) {
        gravity::OrbitCameraConfig config;
        if (auto* tuning = world.try_resource<TuningConfig>()) config = tuning->camera;
        auto controller = std::make_shared<gravity::OrbitCameraController>(config);

        if (auto* field = world.try_resource<std::shared_ptr<gravity::GravityField>>()) {
            if (*field) {
                controller->set_orientation_source(field->get());
                (*field)->add_listener(controller.get());
            }
        } else {
            std::cout << "[Camera] No gravity field, using world up" << std::endl;
        }
        if (auto* query = world.try_resource<std::shared_ptr<JoltSpatialQuery>>()) {
            controller->set_spatial_query(query->get());
        }

        std::shared_ptr<gravity::CursorControl> cursor = std::make_shared<RaylibCursorControl>();
        controller->set_cursor(cursor.get());
        world.set_resource(std::move(cursor));

        controller->set_first_person_listener([&world](bool first_person) {
            world.each<PlayerTag, MeshRenderer>([&](ecs::Entity, PlayerTag&, MeshRenderer& mesh) {
                mesh.visible = !first_person;
            });
        });

        world.set_resource(std::move(controller));
        pipeline.add_logic([](ecs::World& w, float dt) { CameraSystem::Update(w, dt); });

        if (auto* panel = world.try_resource<DebugPanel>()) {
            panel->watch("Camera", "Mode", [&world]() {
                auto* c = world.try_resource<std::shared_ptr<gravity::OrbitCameraController>>();
                if (!c || !*c) return std::string("-");
                return std::string(gravity::pan_mode_name((*c)->pan_mode()));
            });
            panel->watch("Camera", "Yaw / Pitch", [&world]() {
                auto* c = world.try_resource<std::shared_ptr<gravity::OrbitCameraController>>();
                if (!c || !*c) return std::string("-");
                char b[32];
                std::snprintf(b, sizeof(b), "%.1f / %.1f", (*c)->yaw(), (*c)->pitch());
                return std::string(b);
            });
            panel->watch("Camera", "Zoom", [&world]() {
                auto* c = world.try_resource<std::shared_ptr<gravity::OrbitCameraController>>();
                if (!c || !*c) return std::string("-");
                char b[32];
                std::snprintf(b, sizeof(b), "%.0f%% (%.1f m)", (*c)->zoom_percent() * 100.0f,
                              (*c)->zoom_distance());
                return std::string(b);
            });
            panel->watch("Camera", "View", [&world]() {
                auto* c = world.try_resource<std::shared_ptr<gravity::OrbitCameraController>>();
                if (!c || !*c) return std::string("-");
                if ((*c)->is_stabilizing()) return std::string("Stabilizing");
                if ((*c)->is_auto_aligning()) return std::string("Aligning");
                return std::string((*c)->is_in_first_person() ? "First person" : "Third person");
            });
        }
    }
};
