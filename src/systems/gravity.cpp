#include "gravity.hpp"
#include "../events.hpp"
#include "../physics_handles.hpp"
#include <ecs/modules/transform.hpp>
#include <memory>

using namespace ecs;

void GravitySystem::Register(World& world) {
    world.on_add<GravityZoneConfig>([](World& w, Entity e, GravityZoneConfig&) {
        static std::uint32_t next_id = 0;
        w.add(e, GravityZoneId{next_id++});
    });
}

gravity::GravityZone GravitySystem::make_zone(std::uint32_t id, const GravityZoneConfig& cfg,
                                              const ecs::Vec3& position, const ecs::Quat& rotation) {
    gravity::GravityZone zone;
    zone.id           = id;
    zone.shape        = cfg.shape == GravityZoneShape::Sphere ? gravity::ZoneShape::Sphere
                                                              : gravity::ZoneShape::Box;
    zone.mode         = cfg.mode == GravityZoneMode::Point ? gravity::ZoneMode::Point
                                                           : gravity::ZoneMode::Directional;
    zone.center       = MathBridge::ToJolt(position);
    zone.rotation     = MathBridge::ToJolt(rotation).Normalized();
    zone.half_extents = MathBridge::ToJolt(cfg.half_extents);
    zone.radius       = cfg.radius;
    zone.direction    = MathBridge::ToJolt(cfg.direction).NormalizedOr(-JPH::Vec3::sAxisY());
    zone.priority     = cfg.priority;
    zone.strength     = cfg.strength;
    return zone;
}

void GravitySystem::Update(World& world, float /*dt*/) {
    auto* field_ptr = world.try_resource<std::shared_ptr<gravity::GravityField>>();
    if (!field_ptr || !*field_ptr) return;
    auto& field = **field_ptr;

    std::vector<gravity::GravityZone> zones;
    world.each<GravityZoneConfig, GravityZoneId, LocalTransform>(
        [&](Entity, GravityZoneConfig& cfg, GravityZoneId& id, LocalTransform& lt) {
            zones.push_back(make_zone(id.value, cfg, lt.position, lt.rotation));
        });
    field.set_zones(std::move(zones));

    // Sample at the character's middle, not its feet.
    world.single<PlayerTag, CharacterHandle, CharacterControllerConfig>(
        [&](Entity, PlayerTag&, CharacterHandle& h, CharacterControllerConfig& cfg) {
            JPH::Vec3 center = h.character->GetPosition() +
                               field.frame().up * (0.5f * cfg.height);
            const int before = field.transition_count();
            field.update(center);
            if (field.transition_count() == before) return;

            JPH::Vec3 up = field.frame().up;
            if (auto* events = world.try_resource<Events<GravityChangedEvent>>()) {
                events->send({field.active_zone(), ecs::Vec3{up.GetX(), up.GetY(), up.GetZ()}});
            }
        });
}
