#include "renderer.hpp"
#include "../components.hpp"
#include "../physics_handles.hpp"
#include "../core/gravity_field.hpp"
#include "../core/orbit_camera.hpp"
#include <ecs/modules/transform.hpp>
#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtc/quaternion.hpp>
#include <glm/gtc/type_ptr.hpp>
#include <raylib.h>
#include <raymath.h>
#include <rlgl.h>
#include <memory>

using namespace ecs;

// Convert our engine Color4 to Raylib's Color at draw time.
static inline Color to_raylib(const Color4& c) {
    return Color{
        static_cast<unsigned char>(c.r * 255.0f),
        static_cast<unsigned char>(c.g * 255.0f),
        static_cast<unsigned char>(c.b * 255.0f),
        static_cast<unsigned char>(c.a * 255.0f),
    };
}

static inline Vector3 to_v3(const JPH::Vec3& v) { return {v.GetX(), v.GetY(), v.GetZ()}; }

// Column-major model matrix for a zone volume.
static glm::mat4 zone_matrix(const LocalTransform& lt) {
    glm::quat rot(lt.rotation.w, lt.rotation.x, lt.rotation.y, lt.rotation.z);
    glm::mat4 m = glm::translate(glm::mat4(1.0f), glm::vec3(lt.position.x, lt.position.y, lt.position.z));
    return m * glm::mat4_cast(rot);
}

static void draw_zones(World& world) {
    std::uint32_t active = gravity::GravityField::kNoZone;
    if (auto* field = world.try_resource<std::shared_ptr<gravity::GravityField>>()) {
        if (*field) active = (*field)->active_zone();
    }

    world.each<GravityZoneConfig, LocalTransform>(
        [&](Entity e, GravityZoneConfig& zone, LocalTransform& lt) {
            Color col = to_raylib(Colors::ZoneWire);
            if (auto* id = world.try_get<GravityZoneId>(e)) {
                if (id->value == active) col = YELLOW;
            }

            glm::mat4 m = zone_matrix(lt);
            rlPushMatrix();
            rlMultMatrixf(glm::value_ptr(m));
            if (zone.shape == GravityZoneShape::Sphere) {
                DrawSphereWires({0, 0, 0}, zone.radius, 8, 12, col);
            } else {
                DrawCubeWires({0, 0, 0}, 2.0f * zone.half_extents.x, 2.0f * zone.half_extents.y,
                              2.0f * zone.half_extents.z, col);
            }
            if (zone.mode == GravityZoneMode::Directional) {
                Vector3 d = {zone.direction.x, zone.direction.y, zone.direction.z};
                DrawLine3D({0, 0, 0}, Vector3Scale(d, 2.0f), col);
            }
            rlPopMatrix();
        });
}

void RenderSystem::Update(World& world) {
    ClearBackground({35, 35, 40, 255});

    // 1. Build Camera3D from MainCamera data
    Camera3D camera = {};
    camera.projection = CAMERA_PERSPECTIVE;
    camera.fovy       = 60.0f;
    camera.up         = {0, 1, 0};
    if (auto* cam = world.try_resource<MainCamera>()) {
        camera.position = {cam->position.x, cam->position.y, cam->position.z};
        camera.target   = {cam->target.x,   cam->target.y,   cam->target.z};
        camera.up       = {cam->up.x,       cam->up.y,       cam->up.z};
        camera.fovy     = cam->fovy;
    }

    // 2. Render Scene
    BeginMode3D(camera);
        DrawGrid(100, 2.0f);
        world.each<WorldTransform, MeshRenderer>(
            [&](Entity e, WorldTransform& wt, MeshRenderer& mesh) {
                if (!mesh.visible) return;

                rlPushMatrix();
                rlMultMatrixf((float*)&wt.matrix);
                Color col = to_raylib(mesh.color);
                if (mesh.shape != ShapeType::Capsule) {
                    rlScalef(mesh.scale_offset.x, mesh.scale_offset.y, mesh.scale_offset.z);
                }
                switch (mesh.shape) {
                    case ShapeType::Box:     DrawCube({0,0,0}, 1.0f, 1.0f, 1.0f, col); break;
                    case ShapeType::Sphere:  DrawSphere({0,0,0}, 0.5f, col);            break;
                    case ShapeType::Capsule: {
                        float radius = 0.4f, height = 1.8f;
                        if (auto* cfg = world.try_get<CharacterControllerConfig>(e)) {
                            radius = cfg->radius;
                            height = cfg->height;
                        }
                        DrawCapsule({0, radius, 0}, {0, height - radius, 0}, radius, 8, 8, col);
                        break;
                    }
                }
                rlPopMatrix();

                // Orientation gizmo on the player
                if (world.has<PlayerTag>(e)) {
                    auto* h_ptr = world.try_get<CharacterHandle>(e);
                    if (!h_ptr) return;
                    auto& ch = h_ptr->character;

                    JPH::Vec3 j_up    = ch->GetRotation() * JPH::Vec3::sAxisY();
                    JPH::Vec3 j_fwd   = ch->GetRotation() * JPH::Vec3::sAxisZ();
                    JPH::Vec3 j_right = j_fwd.Cross(j_up);
                    JPH::Vec3 origin  = ch->GetPosition() + j_up;

                    Vector3 pos = to_v3(origin);
                    DrawLine3D(pos, to_v3(origin + j_fwd * 1.5f), RED);
                    DrawLine3D(pos, to_v3(origin + j_right),      BLUE);
                    DrawLine3D(pos, to_v3(origin + j_up),         GREEN);
                }
            });
        draw_zones(world);
    EndMode3D();

    // 3. Render UI
    DrawFPS(10, 10);
    DrawText("WASD: Move | SPACE: Jump | RMB: Orbit + Steer | LMB: Free Look | LMB+RMB: Autorun",
             10, 30, 20, LIGHTGRAY);
    DrawText("Wheel: Zoom | C: Reset Camera | Q: Camera Hold | V: See-Through | R: Reload | F3: Debug",
             10, 55, 20, YELLOW);

    if (auto* ctrl = world.try_resource<std::shared_ptr<gravity::OrbitCameraController>>()) {
        if (*ctrl) {
            const char* mode = gravity::pan_mode_name((*ctrl)->pan_mode());
            DrawText(TextFormat("CAMERA: %s%s", mode, (*ctrl)->is_in_first_person() ? " (FIRST PERSON)" : ""),
                     10, 80, 20, (*ctrl)->is_panning_active() ? GREEN : SKYBLUE);
        }
    }
}
