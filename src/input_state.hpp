#pragma once
#include <raylib.h>

// One button's state for the current frame.
struct ButtonSample {
    bool down     = false;
    bool pressed  = false;
    bool released = false;
};

// Key and button assignments (world resource, installed by InputModule).
// Values are Raylib KeyboardKey / MouseButton codes.
struct InputBindings {
    int forward      = KEY_W;
    int back         = KEY_S;
    int left         = KEY_A;
    int right        = KEY_D;
    int jump         = KEY_SPACE;
    int reset_camera = KEY_C;
    int camera_hold  = KEY_Q;
    int phase_view   = KEY_V;

    int orbit_button     = MOUSE_BUTTON_RIGHT;   // drags the camera and turns the character
    int free_look_button = MOUSE_BUTTON_LEFT;    // drags the camera only

    float stick_deadzone = 0.15f;
};

// Snapshot of the frame's device state, already resolved through
// InputBindings. Written by InputGatherSystem, read by PlayerInputSystem
// and CameraSystem.
struct InputRecord {
    // Keyboard and left stick combined. X = strafe, Y = forward.
    Vector2 move = {0, 0};

    // Edge-triggered actions
    bool jump         = false;
    bool reset_camera = false;
    bool camera_hold  = false;
    bool phase_view   = false;

    // Pointer
    Vector2      pointer       = {0, 0};
    Vector2      pointer_delta = {0, 0};
    float        wheel         = 0.0f;
    ButtonSample orbit;
    ButtonSample free_look;

    int gamepad = -1;   // first real gamepad, -1 when none
};
