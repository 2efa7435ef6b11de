#pragma once
#include <ecs/ecs.hpp>
#include <vector>
#include "../components.hpp"
#include "../core/gravity_field.hpp"

// Feeds GravityZoneConfig entities into the GravityField resource and
// re-evaluates the active zone at the player's position. First step of the
// fixed Physics phase; everything after it reads the field's frame.
class GravitySystem {
public:
    static void Register(ecs::World& world);
    static void Update(ecs::World& world, float dt);

    // Converts a zone component placed at position/rotation into the core type.
    static gravity::GravityZone make_zone(std::uint32_t id, const GravityZoneConfig& cfg,
                                          const ecs::Vec3& position, const ecs::Quat& rotation);
};
