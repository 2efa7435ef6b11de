#include "input_gather.hpp"
#include "../input_state.hpp"
#include <raylib.h>
#include <cmath>
#include <string>

// Laptops report sensors and keyboards as joysticks; only accept devices that
// look like a real pad.
static bool IsRealGamepad(int i) {
    if (!IsGamepadAvailable(i)) return false;
    if (GetGamepadAxisCount(i) < 4) return false;

    const char* name = GetGamepadName(i);
    if (!name) return false;
    std::string n = name;
    const char* blacklist[] = {
        "Keyboard", "Mouse", "Trackpad", "Touchpad", "Accelerometer",
        "Sensor", "Consumer Control", "System Control", "Power Button"
    };
    for (const char* b : blacklist) {
        if (n.find(b) != std::string::npos) return false;
    }
    return true;
}

static ButtonSample SampleMouse(int button) {
    ButtonSample s;
    s.down     = IsMouseButtonDown(button);
    s.pressed  = IsMouseButtonPressed(button);
    s.released = IsMouseButtonReleased(button);
    return s;
}

static float Deadzoned(float v, float deadzone) {
    return std::abs(v) > deadzone ? v : 0.0f;
}

template<typename T>
static T& EnsureResource(ecs::World& world) {
    if (!world.try_resource<T>()) world.set_resource(T{});
    return *world.try_resource<T>();
}

void InputGatherSystem::Update(ecs::World& world) {
    const InputBindings& b = EnsureResource<InputBindings>(world);
    InputRecord& input     = EnsureResource<InputRecord>(world);
    input = InputRecord{};

    // 1. Keyboard
    if (IsKeyDown(b.forward)) input.move.y += 1.0f;
    if (IsKeyDown(b.back))    input.move.y -= 1.0f;
    if (IsKeyDown(b.left))    input.move.x -= 1.0f;
    if (IsKeyDown(b.right))   input.move.x += 1.0f;

    input.jump         = IsKeyPressed(b.jump);
    input.reset_camera = IsKeyPressed(b.reset_camera);
    input.camera_hold  = IsKeyPressed(b.camera_hold);
    input.phase_view   = IsKeyPressed(b.phase_view);

    // 2. Pointer
    input.pointer       = GetMousePosition();
    input.pointer_delta = GetMouseDelta();
    input.wheel         = GetMouseWheelMove();
    input.orbit         = SampleMouse(b.orbit_button);
    input.free_look     = SampleMouse(b.free_look_button);

    // 3. First real gamepad: left stick moves, south face jumps, right thumb resets the camera
    for (int i = 0; i < 4; i++) {
        if (!IsRealGamepad(i)) continue;
        input.gamepad = i;
        input.move.x += Deadzoned(GetGamepadAxisMovement(i, GAMEPAD_AXIS_LEFT_X), b.stick_deadzone);
        input.move.y -= Deadzoned(GetGamepadAxisMovement(i, GAMEPAD_AXIS_LEFT_Y), b.stick_deadzone);
        input.jump         |= IsGamepadButtonPressed(i, GAMEPAD_BUTTON_RIGHT_FACE_DOWN);
        input.reset_camera |= IsGamepadButtonPressed(i, GAMEPAD_BUTTON_RIGHT_THUMB);
        break;
    }
}
