#include "jolt_spatial_query.hpp"
#include <Jolt/Physics/Body/Body.h>
#include <Jolt/Physics/Body/BodyFilter.h>
#include <Jolt/Physics/Body/BodyLock.h>
#include <Jolt/Physics/Collision/CastResult.h>
#include <Jolt/Physics/Collision/CollisionCollectorImpl.h>
#include <Jolt/Physics/Collision/NarrowPhaseQuery.h>
#include <Jolt/Physics/Collision/RayCast.h>
#include <Jolt/Physics/Collision/ShapeCast.h>
#include <Jolt/Physics/Collision/Shape/CapsuleShape.h>
#include <Jolt/Physics/Collision/Shape/SphereShape.h>

namespace {

class MaskObjectLayerFilter final : public JPH::ObjectLayerFilter {
public:
    explicit MaskObjectLayerFilter(std::uint32_t mask) : mask_(mask) {}

    bool ShouldCollide(JPH::ObjectLayer inLayer) const override {
        return (JoltSpatialQuery::layer_bit(inLayer) & mask_) != 0;
    }

private:
    std::uint32_t mask_;
};

// Either the single ignored body or nothing.
class OptionalIgnoreBodyFilter final : public JPH::BodyFilter {
public:
    explicit OptionalIgnoreBodyFilter(gravity::ColliderId ignore) : ignore_(ignore) {}

    bool ShouldCollide(const JPH::BodyID& inBodyID) const override {
        return ignore_ == gravity::kNoCollider || inBodyID.GetIndexAndSequenceNumber() != ignore_;
    }

    bool ShouldCollideLocked(const JPH::Body& inBody) const override {
        return ShouldCollide(inBody.GetID());
    }

private:
    gravity::ColliderId ignore_;
};

std::vector<gravity::QueryHit> collect_shape_hits(const JPH::PhysicsSystem& system,
                                                  const JPH::Shape* shape,
                                                  JPH::Vec3Arg center, JPH::QuatArg rotation,
                                                  JPH::Vec3Arg direction, float max_distance,
                                                  const gravity::QueryFilter& filter) {
    std::vector<gravity::QueryHit> out;
    if (max_distance <= 0.0f) return out;

    JPH::RShapeCast cast(shape, JPH::Vec3::sReplicate(1.0f),
                         JPH::RMat44::sRotationTranslation(rotation, center),
                         direction * max_distance);
    JPH::ShapeCastSettings settings;   // back faces ignored by default

    JPH::AllHitCollisionCollector<JPH::CastShapeCollector> collector;
    JPH::BroadPhaseLayerFilter bp_filter;
    MaskObjectLayerFilter      obj_filter(filter.layer_mask);
    OptionalIgnoreBodyFilter   body_filter(filter.ignore);

    system.GetNarrowPhaseQuery().CastShape(cast, settings, JPH::RVec3::sZero(), collector,
                                           bp_filter, obj_filter, body_filter);
    collector.Sort();

    const JPH::BodyLockInterface& locks = system.GetBodyLockInterface();
    for (const auto& r : collector.mHits) {
        gravity::QueryHit hit;
        hit.point    = JPH::Vec3(r.mContactPointOn2);
        hit.normal   = (-r.mPenetrationAxis).NormalizedOr(-direction);
        hit.distance = r.mFraction * max_distance;
        hit.collider = JoltSpatialQuery::to_collider(r.mBodyID2);

        JPH::BodyLockRead lock(locks, r.mBodyID2);
        if (lock.Succeeded()) hit.layer = JoltSpatialQuery::layer_bit(lock.GetBody().GetObjectLayer());
        out.push_back(hit);
    }
    return out;
}

} // namespace

std::vector<gravity::QueryHit> JoltSpatialQuery::ray_cast_all(JPH::Vec3Arg origin,
                                                              JPH::Vec3Arg direction,
                                                              float max_distance,
                                                              const gravity::QueryFilter& filter) const {
    std::vector<gravity::QueryHit> out;
    if (!system_ || max_distance <= 0.0f) return out;

    JPH::RRayCast ray{JPH::RVec3(origin), direction * max_distance};
    JPH::RayCastSettings settings;

    JPH::AllHitCollisionCollector<JPH::CastRayCollector> collector;
    JPH::BroadPhaseLayerFilter bp_filter;
    MaskObjectLayerFilter      obj_filter(filter.layer_mask);
    OptionalIgnoreBodyFilter   body_filter(filter.ignore);

    system_->GetNarrowPhaseQuery().CastRay(ray, settings, collector, bp_filter, obj_filter, body_filter);
    collector.Sort();

    const JPH::BodyLockInterface& locks = system_->GetBodyLockInterface();
    for (const auto& r : collector.mHits) {
        gravity::QueryHit hit;
        JPH::RVec3 point = ray.GetPointOnRay(r.mFraction);
        hit.point    = JPH::Vec3(point);
        hit.distance = r.mFraction * max_distance;
        hit.collider = to_collider(r.mBodyID);
        hit.normal   = -direction;

        JPH::BodyLockRead lock(locks, r.mBodyID);
        if (lock.Succeeded()) {
            const JPH::Body& body = lock.GetBody();
            hit.normal = body.GetWorldSpaceSurfaceNormal(r.mSubShapeID2, point);
            hit.layer  = layer_bit(body.GetObjectLayer());
        }
        out.push_back(hit);
    }
    return out;
}

std::vector<gravity::QueryHit> JoltSpatialQuery::sphere_cast_all(JPH::Vec3Arg origin, float radius,
                                                                 JPH::Vec3Arg direction,
                                                                 float max_distance,
                                                                 const gravity::QueryFilter& filter) const {
    if (!system_ || radius <= 0.0f) return {};
    JPH::RefConst<JPH::Shape> sphere = new JPH::SphereShape(radius);
    return collect_shape_hits(*system_, sphere, origin, JPH::Quat::sIdentity(), direction,
                              max_distance, filter);
}

bool JoltSpatialQuery::capsule_cast(JPH::Vec3Arg point_a, JPH::Vec3Arg point_b, float radius,
                                    JPH::Vec3Arg direction, float max_distance,
                                    const gravity::QueryFilter& filter, gravity::QueryHit& hit) const {
    if (!system_ || radius <= 0.0f) return false;

    JPH::Vec3 axis        = point_b - point_a;
    float     half_height = 0.5f * axis.Length();
    JPH::Vec3 center      = point_a + 0.5f * axis;

    // Jolt capsules run along local Y.
    JPH::RefConst<JPH::Shape> shape;
    JPH::Quat rotation = JPH::Quat::sIdentity();
    if (half_height > 1.0e-4f) {
        shape    = new JPH::CapsuleShape(half_height, radius);
        rotation = JPH::Quat::sFromTo(JPH::Vec3::sAxisY(), axis / (2.0f * half_height));
    } else {
        shape = new JPH::SphereShape(radius);
    }

    std::vector<gravity::QueryHit> hits =
        collect_shape_hits(*system_, shape, center, rotation, direction, max_distance, filter);
    if (hits.empty()) return false;
    hit = hits.front();
    return true;
}
