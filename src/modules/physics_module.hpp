#pragma once
#include "../jolt_spatial_query.hpp"
#include "../physics_context.hpp"
#include "../pipeline.hpp"
#include "../systems/physics.hpp"
#include <ecs/ecs.hpp>
#include <ecs/modules/transform_propagation.hpp>
#include <memory>

// ---------------------------------------------------------------------------
// PhysicsModule
//
// Initialises Jolt's allocator, creates and registers the PhysicsContext
// world resource plus the JoltSpatialQuery that the ground probe and the
// camera cast through, and installs PhysicsSystem lifecycle hooks
// (on_add/on_remove for RigidBodyConfig).
//
// install_step() adds the fixed-step Jolt update + transform propagation. It
// must be the last Physics-phase install, after GravityModule and
// CharacterModule have added their fixed-step systems.
// ---------------------------------------------------------------------------

struct PhysicsModule {
    static void install(ecs::World& world, ecs::Pipeline& /*pipeline*/) {
        PhysicsContext::InitJoltAllocator();
        auto ctx = std::make_shared<PhysicsContext>();
        world.set_resource(std::make_shared<JoltSpatialQuery>(ctx->physics_system));
        world.set_resource(std::move(ctx));
        PhysicsSystem::Register(world);
    }

    static void install_step(ecs::World& /*world*/, ecs::Pipeline& pipeline) {
        pipeline.add_physics([](ecs::World& w, float dt) {
            PhysicsSystem::Update(w, dt);
            ecs::propagate_transforms(w);
        });
    }
};
