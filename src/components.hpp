#pragma once
#include "core/suppression.hpp"
#include <ecs/ecs.hpp>
#include <cstdint>

// ---------------------------------------------------------------------------
// Plain data components. No Jolt or Raylib headers here so the scene loader
// and the character state machine build in the headless test target.
// ---------------------------------------------------------------------------

struct Color4 {
    float r = 1.0f;
    float g = 1.0f;
    float b = 1.0f;
    float a = 1.0f;
};

namespace Colors {
    constexpr Color4 White     = {1.0f,  1.0f,  1.0f,  1.0f};
    constexpr Color4 Gray      = {0.5f,  0.5f,  0.5f,  1.0f};
    constexpr Color4 Orange    = {1.0f,  0.6f,  0.1f,  1.0f};
    constexpr Color4 Sky       = {0.4f,  0.75f, 1.0f,  1.0f};
    constexpr Color4 ZoneWire  = {0.3f,  0.9f,  0.6f,  0.6f};
}

enum class ShapeType : std::uint8_t { Box, Sphere, Capsule };

enum class BodyType : std::uint8_t { Static, Dynamic, Kinematic };

// --- Physics Data Components ---

struct BoxCollider {
    ecs::Vec3 half_extents = {0.5f, 0.5f, 0.5f};
};

struct SphereCollider {
    float radius = 0.5f;
};

struct RigidBodyConfig {
    BodyType type        = BodyType::Dynamic;
    float    mass        = 1.0f;
    float    friction    = 0.5f;
    float    restitution = 0.0f;
    bool     sensor      = false;
    bool     phase       = false;   // on the layer the camera can be told to see through
};

struct CharacterControllerConfig {
    float height          = 1.8f;
    float radius          = 0.4f;
    float mass            = 70.0f;
    float max_slope_angle = 55.0f;
    float align_speed     = 10.0f;   // up-alignment slerp rate
    float turn_speed      = 10.0f;   // facing slerp rate
    float stick_to_floor  = 0.5f;    // snap distance along -up while walkable
    float step_height     = 0.4f;
};

// --- Gravity ---

enum class GravityZoneShape : std::uint8_t { Box, Sphere };
enum class GravityZoneMode  : std::uint8_t { Directional, Point };

// Gravity volume placed with the entity's LocalTransform.
struct GravityZoneConfig {
    GravityZoneShape shape        = GravityZoneShape::Box;
    GravityZoneMode  mode         = GravityZoneMode::Directional;
    ecs::Vec3        half_extents = {5.0f, 5.0f, 5.0f};
    float            radius       = 5.0f;
    ecs::Vec3        direction    = {0.0f, -1.0f, 0.0f};
    int              priority     = 0;
    float            strength     = 9.81f;
};

// Stable zone id, assigned by GravitySystem's on_add hook.
struct GravityZoneId {
    std::uint32_t value = 0;
};

// --- Rendering ---

struct MeshRenderer {
    ShapeType shape        = ShapeType::Box;
    Color4    color        = Colors::White;
    ecs::Vec3 scale_offset = {1, 1, 1};
    bool      visible      = true;
};

// --- Gameplay ---

struct PlayerInput {
    ecs::Vec2 move_input = {0, 0};   // X = strafe, Y = forward
    bool      jump       = false;
    bool      autorun    = false;    // both mouse buttons held

    // Edge-triggered camera keys
    bool reset_camera       = false;
    bool toggle_camera_hold = false;   // hands the camera to an ability and back
    bool toggle_phase_view  = false;   // see through Phase-layer geometry
};

// Per-frame world-space wishes produced by CharacterInputSystem.
struct CharacterIntent {
    ecs::Vec3 move_dir       = {0, 0, 0};
    ecs::Vec3 look_dir       = {0, 0, 1};
    bool      jump_requested = false;   // latched until the fixed step consumes it
    bool      has_input      = false;
    bool      face_look      = false;   // turn to look_dir instead of the travel direction
};

struct CharacterState {
    enum class Mode : std::uint8_t { Grounded, Airborne, Sliding };

    Mode  mode         = Mode::Airborne;
    int   jump_count   = 0;
    float air_time     = 0.0f;
    float jump_impulse = 0.0f;   // one-tick signal, along up

    gravity::SuppressionCounter jump_suppression;
    bool  holds_suppression = false;   // CharacterStateSystem's own hold while sliding or stopped
};

// Camera output for the renderer and for the character systems.
struct MainCamera {
    ecs::Vec3 position     = {0, 3, -6};
    ecs::Vec3 target       = {0, 1.5f, 0};
    ecs::Vec3 up           = {0, 1, 0};
    float     fovy         = 60.0f;
    float     base_fovy    = 60.0f;
    float     boost_fovy   = 75.0f;

    ecs::Vec3 view_forward = {0, 0, 1};
    ecs::Vec3 view_right   = {-1, 0, 0};
    bool      free_look    = false;
    bool      aligning     = false;
    bool      panning      = false;
    bool      first_person = false;
};

struct PlayerTag {};
struct WorldTag {};
