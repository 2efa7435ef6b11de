#pragma once
#include "core/spatial_query.hpp"
#include <Jolt/Jolt.h>
#include <Jolt/Physics/Body/BodyID.h>
#include <Jolt/Physics/Collision/ObjectLayer.h>
#include <Jolt/Physics/PhysicsSystem.h>

// ---------------------------------------------------------------------------
// JoltSpatialQuery
//
// gravity::SpatialQuery on top of a PhysicsSystem's NarrowPhaseQuery.
// QueryLayers bit i selects object layer i; ColliderId is the BodyID's
// index-and-sequence number. Shape casts report -penetration_axis as the
// normal; ray hits ask the struck body for its surface normal.
// ---------------------------------------------------------------------------

class JoltSpatialQuery final : public gravity::SpatialQuery {
public:
    explicit JoltSpatialQuery(const JPH::PhysicsSystem* system) : system_(system) {}

    std::vector<gravity::QueryHit> ray_cast_all(JPH::Vec3Arg origin, JPH::Vec3Arg direction,
                                                float max_distance,
                                                const gravity::QueryFilter& filter) const override;

    std::vector<gravity::QueryHit> sphere_cast_all(JPH::Vec3Arg origin, float radius,
                                                   JPH::Vec3Arg direction, float max_distance,
                                                   const gravity::QueryFilter& filter) const override;

    bool capsule_cast(JPH::Vec3Arg point_a, JPH::Vec3Arg point_b, float radius,
                      JPH::Vec3Arg direction, float max_distance,
                      const gravity::QueryFilter& filter, gravity::QueryHit& hit) const override;

    static gravity::ColliderId to_collider(const JPH::BodyID& id) {
        return id.GetIndexAndSequenceNumber();
    }

    static std::uint32_t layer_bit(JPH::ObjectLayer layer) {
        return layer < 32 ? (1u << layer) : 0u;
    }

private:
    const JPH::PhysicsSystem* system_ = nullptr;
};
