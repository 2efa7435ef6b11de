#pragma once
#include "../core/cursor_control.hpp"
#include <ecs/ecs.hpp>

// Drives the OrbitCameraController resource from the InputRecord and the
// player's pose, then publishes the result to MainCamera. First Logic step:
// CharacterInputSystem reads MainCamera's view basis right after.
class CameraSystem {
public:
    static void Update(ecs::World& world, float dt);

    // Pushes TuningConfig::camera into the controller (after a scene load).
    static void ApplyTuning(ecs::World& world);
};

// Raylib's cursor: locking hides it and captures relative motion.
class RaylibCursorControl final : public gravity::CursorControl {
public:
    bool is_locked() const override;
    void set_locked(bool locked) override;
    void warp(float x, float y) override;
};
