#include "character_motor.hpp"
#include "../components.hpp"
#include "../math_util.hpp"
#include "../physics_handles.hpp"
#include "../physics_context.hpp"
#include "../jolt_spatial_query.hpp"
#include "../tuning.hpp"
#include "../core/gravity_field.hpp"
#include "../core/orbit_camera.hpp"
#include "../core/speed_state.hpp"
#include <Jolt/Physics/Collision/Shape/CapsuleShape.h>
#include <Jolt/Physics/Collision/Shape/RotatedTranslatedShape.h>
#include <ecs/modules/transform.hpp>
#include <ecs/integration/glm.hpp>
#include <algorithm>
#include <iostream>

using namespace ecs;

namespace {

// Gravity multipliers while falling / rising.
constexpr float kFallGravityScale = 4.0f;
constexpr float kRiseGravityScale = 2.5f;

// Below this dot the character snaps to the new up instead of slerping.
constexpr float kSnapAlignDot = 0.5f;

const JPH::Vec3 kDefaultGravity(0.0f, -9.81f, 0.0f);

JPH::Quat align_to_up(JPH::QuatArg rotation, JPH::Vec3Arg up, float t) {
    JPH::Vec3 current_up = rotation * JPH::Vec3::sAxisY();
    JPH::Quat target     = (JPH::Quat::sFromTo(current_up, up) * rotation).Normalized();
    if (current_up.Dot(up) < kSnapAlignDot || t >= 1.0f) return target;
    return rotation.SLERP(target, t).Normalized();
}

} // namespace

void CharacterMotorSystem::Register(World& world) {
    world.on_add<CharacterControllerConfig>(
        [&](World& w, Entity e, CharacterControllerConfig& cfg) {
            auto* ctx_ptr = w.try_resource<std::shared_ptr<PhysicsContext>>();
            if (!ctx_ptr || !*ctx_ptr) return;
            auto& ctx = **ctx_ptr;

            // Capsule standing on the entity origin.
            float half_cylinder = std::max(0.01f, 0.5f * cfg.height - cfg.radius);
            JPH::RefConst<JPH::ShapeSettings> shape_settings =
                new JPH::RotatedTranslatedShapeSettings(
                    JPH::Vec3(0, 0.5f * cfg.height, 0), JPH::Quat::sIdentity(),
                    new JPH::CapsuleShapeSettings(half_cylinder, cfg.radius));

            auto shape_result = shape_settings->Create();
            if (shape_result.HasError()) {
                std::cerr << "[Character] Shape creation failed: " << shape_result.GetError() << std::endl;
                return;
            }

            JPH::RVec3 pos = JPH::RVec3::sZero();
            JPH::Quat  rot = JPH::Quat::sIdentity();
            if (auto* lt = w.try_get<LocalTransform>(e)) {
                pos = MathBridge::ToJolt(lt->position);
                rot = MathBridge::ToJolt(lt->rotation);
            }

            JPH::CharacterVirtualSettings settings;
            settings.mMass             = cfg.mass;
            settings.mMaxSlopeAngle    = JPH::DegreesToRadians(cfg.max_slope_angle);
            settings.mShape            = shape_result.Get();
            settings.mSupportingVolume = JPH::Plane(JPH::Vec3::sAxisY(), -cfg.radius);

            auto character = std::make_shared<JPH::CharacterVirtual>(
                &settings, pos, rot, ctx.physics_system);

            w.add(e, CharacterHandle{character});

            // --- Ground probe + locomotion ---
            LocomotionHandle loco;
            loco.probe      = std::make_shared<gravity::GroundProbe>();
            loco.locomotion = std::make_shared<gravity::LocomotionResolver>();
            if (auto* tuning = w.try_resource<TuningConfig>()) {
                gravity::GroundProbeConfig probe_cfg = tuning->probe;
                probe_cfg.max_slope_deg = cfg.max_slope_angle;
                loco.probe->set_config(probe_cfg);
                loco.locomotion->set_config(tuning->locomotion);
            }
            if (auto* query = w.try_resource<std::shared_ptr<JoltSpatialQuery>>()) {
                loco.probe->set_query(query->get());
            }

            // Free-look release while moving waits for the camera to swing back.
            loco.locomotion->set_realign_request(
                [&w](float seconds, std::function<void()> on_complete) {
                    auto* cam = w.try_resource<std::shared_ptr<gravity::OrbitCameraController>>();
                    if (!cam || !*cam) return;
                    (*cam)->start_auto_align_behind_character(seconds, std::move(on_complete));
                });

            if (auto* speed = w.try_resource<std::shared_ptr<gravity::VelocityThresholdSpeedState>>()) {
                if (*speed) (*speed)->track(loco.locomotion);
            }

            w.add(e, std::move(loco));
        });
}

void CharacterMotorSystem::Update(World& world, float dt) {
    auto* ctx_ptr = world.try_resource<std::shared_ptr<PhysicsContext>>();
    if (!ctx_ptr || !*ctx_ptr) return;
    auto& ctx = **ctx_ptr;

    JPH::Vec3 up      = JPH::Vec3::sAxisY();
    JPH::Vec3 accel   = kDefaultGravity;
    if (auto* field_ptr = world.try_resource<std::shared_ptr<gravity::GravityField>>()) {
        if (*field_ptr) {
            up      = (*field_ptr)->frame().up;
            accel   = (*field_ptr)->gravity();
        }
    }

    world.each<CharacterHandle, LocomotionHandle, CharacterIntent, CharacterState,
               CharacterControllerConfig, WorldTransform>(
        [&](Entity e, CharacterHandle& h, LocomotionHandle& loco, CharacterIntent& intent,
            CharacterState& state, CharacterControllerConfig& cfg, WorldTransform& wt) {
            auto* ch = h.character.get();

            // --- Up alignment ---
            ch->SetUp(up);
            ch->SetRotation(align_to_up(ch->GetRotation(), up, cfg.align_speed * dt));

            // --- Horizontal movement / slide ---
            const gravity::GroundContact& contact = loco.probe->contact();
            JPH::Vec3 velocity = loco.locomotion->resolve(ch->GetLinearVelocity(), contact, up, dt);

            // --- Along up: jump impulse or gravity ---
            if (state.jump_impulse > 0.0f) {
                velocity = gravity::math::project_on_plane(velocity, up) + up * state.jump_impulse;
            } else if (!loco.locomotion->is_grounded()) {
                float scale = velocity.Dot(up) < 0.0f ? kFallGravityScale : kRiseGravityScale;
                velocity += accel * scale * dt;
            }
            ch->SetLinearVelocity(velocity);

            // --- Facing ---
            if (!contact.is_sliding()) {
                JPH::Vec3 facing = JPH::Vec3::sZero();
                if (intent.face_look) {
                    facing = gravity::math::horizontal_direction(MathBridge::ToJolt(intent.look_dir), up);
                } else {
                    JPH::Vec3 horizontal = gravity::math::project_on_plane(velocity, up);
                    if (horizontal.LengthSq() > 0.1f) facing = horizontal.Normalized();
                }
                if (!gravity::math::is_degenerate(facing)) {
                    JPH::Quat target_rot = gravity::math::look_rotation(facing, up);
                    ch->SetRotation(
                        ch->GetRotation().SLERP(target_rot, std::min(1.0f, cfg.turn_speed * dt)).Normalized());
                }
            }

            // --- Extended Update (steps the character through the world) ---
            JPH::DefaultBroadPhaseLayerFilter bp_filter(
                ctx.object_vs_broadphase_layer_filter, Layers::CHARACTER);
            JPH::DefaultObjectLayerFilter obj_filter(
                ctx.object_layer_pair_filter, Layers::CHARACTER);
            JPH::BodyFilter  body_filter;
            JPH::ShapeFilter shape_filter;
            JPH::CharacterVirtual::ExtendedUpdateSettings ext_settings;
            ext_settings.mWalkStairsStepUp     = up * cfg.step_height;
            ext_settings.mStickToFloorStepDown = contact.walkable && state.jump_impulse <= 0.0f
                                                     ? -up * cfg.stick_to_floor
                                                     : JPH::Vec3::sZero();

            ch->ExtendedUpdate(dt, accel, ext_settings,
                               bp_filter, obj_filter, body_filter, shape_filter,
                               *ctx.temp_allocator);

            // --- Sync Jolt position back to ECS transforms ---
            if (auto* lt = world.try_get<LocalTransform>(e)) {
                lt->position = MathBridge::FromJolt(ch->GetPosition());
                lt->rotation = MathBridge::FromJolt(ch->GetRotation());
                wt.matrix    = mat4_compose(lt->position, lt->rotation, lt->scale);
            }
        });
}
