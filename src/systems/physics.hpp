#pragma once
#include <ecs/ecs.hpp>

// Owns Jolt rigid bodies: creates them from RigidBodyConfig + collider on add,
// destroys them with the handle, and steps the simulation in the fixed
// Physics phase. Jolt's global gravity is off: each dynamic body gets the
// gravity of the zone it sits in, then syncs back to the ECS transforms.
class PhysicsSystem {
public:
    static void Register(ecs::World& world);
    static void Update(ecs::World& world, float dt);
};
