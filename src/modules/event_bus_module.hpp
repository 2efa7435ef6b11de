#pragma once
#include "../events.hpp"
#include "../pipeline.hpp"
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// EventBusModule
//
// Creates the EventRegistry world resource, registers every game event queue
// (JumpEvent, LandEvent, GravityChangedEvent) and installs the per-frame
// flush as the first Pre-Update step. Install first: emitters look their
// queue up with try_resource and silently skip sending when it is missing.
//
// Queues are flushed once per rendered frame, so anything sent during
// Pipeline::advance stays readable through the following Render phase.
// ---------------------------------------------------------------------------

struct EventBusModule {
    static void install(ecs::World& world, ecs::Pipeline& pipeline) {
        world.set_resource(EventRegistry{});
        auto& registry = world.resource<EventRegistry>();
        registry.register_queue<JumpEvent>(world);
        registry.register_queue<LandEvent>(world);
        registry.register_queue<GravityChangedEvent>(world);

        pipeline.add_pre_update([](ecs::World& w, float) {
            w.resource<EventRegistry>().flush_all();
        });
    }
};
