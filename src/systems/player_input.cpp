#include "player_input.hpp"
#include "../components.hpp"
#include "../input_state.hpp"
#include <cmath>

using namespace ecs;

void PlayerInputSystem::Update(World& world) {
    auto* input_ptr = world.try_resource<InputRecord>();
    if (!input_ptr) return;
    const auto& record = *input_ptr;

    world.single<PlayerInput>([&](Entity, PlayerInput& input) {
        input.move_input         = {record.move.x, record.move.y};
        input.jump               = record.jump;
        input.reset_camera       = record.reset_camera;
        input.toggle_camera_hold = record.camera_hold;
        input.toggle_phase_view  = record.phase_view;

        // Holding both camera buttons runs forward
        input.autorun = record.orbit.down && record.free_look.down;

        // Diagonals and keyboard + stick never exceed unit length
        float mag_sq = input.move_input.x * input.move_input.x + input.move_input.y * input.move_input.y;
        if (mag_sq > 1.0f) {
            float mag = std::sqrt(mag_sq);
            input.move_input.x /= mag;
            input.move_input.y /= mag;
        }
    });
}
