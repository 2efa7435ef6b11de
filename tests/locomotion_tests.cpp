#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "../src/core/locomotion.hpp"
#include "../src/math_util.hpp"
#include <cmath>
#include <functional>
#include <memory>

using namespace gravity;
using Catch::Matchers::WithinAbs;

namespace {

const JPH::Vec3 kUp = JPH::Vec3::sAxisY();

CameraBasis basis(JPH::Vec3Arg forward, bool free_look = false, bool aligning = false) {
    CameraBasis b;
    b.forward   = forward;
    b.right     = math::right_of(forward, kUp).NormalizedOr(-JPH::Vec3::sAxisX());
    b.free_look = free_look;
    b.aligning  = aligning;
    return b;
}

MoveInput stick(float x, float y, bool autorun = false) {
    MoveInput in;
    in.x       = x;
    in.y       = y;
    in.autorun = autorun;
    return in;
}

GroundContact flat_ground() {
    GroundContact c;
    c.has_hit  = true;
    c.walkable = true;
    c.normal   = kUp;
    return c;
}

GroundContact steep(float slope_deg) {
    float r = slope_deg * math::kDegToRad;
    GroundContact c;
    c.has_hit   = true;
    c.walkable  = false;
    c.slope_deg = slope_deg;
    c.normal    = JPH::Vec3(0.0f, std::cos(r), std::sin(r));
    return c;
}

void check_vec(JPH::Vec3Arg actual, JPH::Vec3Arg expected, float eps = 1e-3f) {
    CHECK_THAT(actual.GetX(), WithinAbs(expected.GetX(), eps));
    CHECK_THAT(actual.GetY(), WithinAbs(expected.GetY(), eps));
    CHECK_THAT(actual.GetZ(), WithinAbs(expected.GetZ(), eps));
}

} // namespace

// ---------------------------------------------------------------------------
// Input mapping
// ---------------------------------------------------------------------------

TEST_CASE("Locomotion - map_input through a camera basis", "[locomotion]") {
    const JPH::Vec3 fwd   = JPH::Vec3::sAxisZ();
    const JPH::Vec3 right = -JPH::Vec3::sAxisX();

    SECTION("Forward") {
        check_vec(LocomotionResolver::map_input(0.0f, 1.0f, fwd, right), fwd);
    }
    SECTION("Strafe right") {
        check_vec(LocomotionResolver::map_input(1.0f, 0.0f, fwd, right), right);
    }
    SECTION("Diagonal is clamped to unit length") {
        CHECK_THAT(LocomotionResolver::map_input(1.0f, 1.0f, fwd, right).Length(), WithinAbs(1.0f, 1e-4f));
    }
    SECTION("Partial stick keeps its magnitude") {
        CHECK_THAT(LocomotionResolver::map_input(0.0f, 0.5f, fwd, right).Length(), WithinAbs(0.5f, 1e-4f));
    }
    SECTION("Dead zone") {
        CHECK(LocomotionResolver::map_input(0.05f, 0.0f, fwd, right) == JPH::Vec3::sZero());
    }
}

TEST_CASE("Locomotion - move direction lies in the plane of a sideways up", "[locomotion]") {
    const JPH::Vec3 wall_up = JPH::Vec3::sAxisX();
    CameraBasis cam;
    cam.forward = JPH::Vec3::sAxisZ();
    cam.right   = math::right_of(cam.forward, wall_up);

    LocomotionResolver loco;
    loco.update_input(stick(0.0f, 1.0f), cam, wall_up, JPH::Vec3::sAxisZ());
    check_vec(loco.move_direction(), JPH::Vec3::sAxisZ());
    CHECK_THAT(loco.move_direction().Dot(wall_up), WithinAbs(0.0f, 1e-5f));

    loco.update_input(stick(1.0f, 0.0f), cam, wall_up, JPH::Vec3::sAxisZ());
    CHECK_THAT(loco.move_direction().Dot(wall_up), WithinAbs(0.0f, 1e-5f));
    CHECK(loco.has_movement_input());
}

TEST_CASE("Locomotion - camera looking along up falls back to the character's forward", "[locomotion]") {
    CameraBasis cam;
    cam.forward = kUp;
    cam.right   = JPH::Vec3::sZero();

    LocomotionResolver loco;
    loco.update_input(stick(0.0f, 1.0f), cam, kUp, JPH::Vec3::sAxisX());
    check_vec(loco.move_direction(), JPH::Vec3::sAxisX());
}

TEST_CASE("Locomotion - autorun drives forward without stick input", "[locomotion]") {
    LocomotionResolver loco;
    loco.update_input(stick(0.0f, 0.0f, true), basis(JPH::Vec3::sAxisZ()), kUp, JPH::Vec3::sAxisZ());
    CHECK(loco.has_movement_input());
    check_vec(loco.move_direction(), JPH::Vec3::sAxisZ());
}

// ---------------------------------------------------------------------------
// Walkable ground
// ---------------------------------------------------------------------------

TEST_CASE("Locomotion - grounded velocity approaches the target speed", "[locomotion]") {
    LocomotionConfig cfg;
    cfg.move_speed = 8.0f;
    LocomotionResolver loco(cfg);
    loco.update_input(stick(0.0f, 1.0f), basis(JPH::Vec3::sAxisZ()), kUp, JPH::Vec3::sAxisZ());

    JPH::Vec3 v = JPH::Vec3::sZero();
    v = loco.resolve(v, flat_ground(), kUp, 0.05f);
    CHECK(loco.is_grounded());
    CHECK(v.GetZ() > 0.0f);
    CHECK(v.GetZ() < 8.0f);

    for (int i = 0; i < 200; ++i) v = loco.resolve(v, flat_ground(), kUp, 0.05f);
    check_vec(v, JPH::Vec3(0.0f, 0.0f, 8.0f), 1e-2f);
    CHECK_THAT(loco.horizontal_speed(), WithinAbs(8.0f, 1e-2f));
}

TEST_CASE("Locomotion - idle damping is exponential", "[locomotion]") {
    LocomotionConfig cfg;
    cfg.ground_friction_damp = 10.0f;
    LocomotionResolver loco(cfg);
    loco.update_input(stick(0.0f, 0.0f), basis(JPH::Vec3::sAxisZ()), kUp, JPH::Vec3::sAxisZ());
    CHECK_FALSE(loco.has_movement_input());

    JPH::Vec3 v = loco.resolve(JPH::Vec3(10.0f, -3.0f, 0.0f), flat_ground(), kUp, 0.1f);
    CHECK_THAT(v.GetX(), WithinAbs(10.0f * std::exp(-1.0f), 1e-4f));
    CHECK(v.GetY() == 0.0f);   // grounded bodies carry nothing along up
}

TEST_CASE("Locomotion - airborne without input keeps its momentum", "[locomotion]") {
    LocomotionResolver loco;
    loco.update_input(stick(0.0f, 0.0f), basis(JPH::Vec3::sAxisZ()), kUp, JPH::Vec3::sAxisZ());

    JPH::Vec3 v = loco.resolve(JPH::Vec3(4.0f, -2.0f, 0.0f), GroundContact{}, kUp, 0.1f);
    CHECK_FALSE(loco.is_grounded());
    check_vec(v, JPH::Vec3(4.0f, -2.0f, 0.0f));
}

TEST_CASE("Locomotion - speed modifiers stack and respect the floor", "[locomotion]") {
    LocomotionConfig cfg;
    cfg.move_speed     = 8.0f;
    cfg.min_move_speed = 0.1f;
    LocomotionResolver loco(cfg);

    loco.add_speed_modifier(4.0f);
    CHECK_THAT(loco.current_move_speed(), WithinAbs(12.0f, 1e-5f));

    loco.add_speed_modifier(-100.0f);
    CHECK_THAT(loco.current_move_speed(), WithinAbs(0.1f, 1e-5f));

    loco.remove_speed_modifier(-100.0f);
    loco.remove_speed_modifier(4.0f);
    CHECK_THAT(loco.current_move_speed(), WithinAbs(8.0f, 1e-5f));
}

// ---------------------------------------------------------------------------
// Sliding
// ---------------------------------------------------------------------------

TEST_CASE("Locomotion - steep ground slides downhill and ignores input", "[locomotion]") {
    LocomotionConfig cfg;
    cfg.slide_accel     = 30.0f;
    cfg.slide_max_speed = 14.0f;
    LocomotionResolver loco(cfg);
    loco.update_input(stick(0.0f, 1.0f), basis(-JPH::Vec3::sAxisZ()), kUp, JPH::Vec3::sAxisZ());

    const GroundContact slope = steep(60.0f);
    const JPH::Vec3 downhill =
        math::project_on_plane(-kUp, slope.normal).Normalized();

    SECTION("Accelerates along the slope") {
        JPH::Vec3 v = loco.resolve(JPH::Vec3::sZero(), slope, kUp, 0.1f);
        CHECK(loco.is_sliding());
        CHECK_FALSE(loco.is_grounded());
        check_vec(v, downhill * 3.0f);
    }

    SECTION("Uphill velocity is cancelled") {
        JPH::Vec3 v = loco.resolve(-downhill * 5.0f, slope, kUp, 0.1f);
        check_vec(v, downhill * 3.0f);
    }

    SECTION("Capped at the slide speed") {
        JPH::Vec3 v = JPH::Vec3::sZero();
        for (int i = 0; i < 100; ++i) v = loco.resolve(v, slope, kUp, 0.1f);
        CHECK_THAT(v.Dot(downhill), WithinAbs(14.0f, 1e-3f));
    }
}

// ---------------------------------------------------------------------------
// External control and jump lockout
// ---------------------------------------------------------------------------

TEST_CASE("Locomotion - external stop zeroes horizontal motion", "[locomotion]") {
    LocomotionResolver loco;
    loco.set_external_stop_movement(true);
    loco.update_input(stick(0.0f, 1.0f), basis(JPH::Vec3::sAxisZ()), kUp, JPH::Vec3::sAxisZ());
    CHECK_FALSE(loco.has_movement_input());
    CHECK(loco.is_externally_stopped());

    JPH::Vec3 v = loco.resolve(JPH::Vec3(5.0f, 0.0f, 5.0f), flat_ground(), kUp, 0.1f);
    check_vec(v, JPH::Vec3::sZero());

    loco.set_external_stop_movement(false);
    loco.update_input(stick(0.0f, 1.0f), basis(JPH::Vec3::sAxisZ()), kUp, JPH::Vec3::sAxisZ());
    CHECK(loco.has_movement_input());
}

TEST_CASE("Locomotion - external hold overrides input for its duration", "[locomotion]") {
    LocomotionResolver loco;
    loco.update_input(stick(0.0f, 1.0f), basis(JPH::Vec3::sAxisZ()), kUp, JPH::Vec3::sAxisZ());

    loco.hold_external_horizontal(JPH::Vec3(5.0f, 2.0f, 0.0f), 0.45f);
    REQUIRE(loco.is_holding_external());

    JPH::Vec3 v = loco.resolve(JPH::Vec3::sZero(), flat_ground(), kUp, 0.1f);
    check_vec(v, JPH::Vec3(5.0f, 0.0f, 0.0f));

    for (int i = 0; i < 4; ++i) v = loco.resolve(v, flat_ground(), kUp, 0.1f);
    CHECK_FALSE(loco.is_holding_external());
    CHECK(v.GetZ() > 0.0f);   // back to steering toward the input
}

TEST_CASE("Locomotion - hold with no duration uses the configured default", "[locomotion]") {
    LocomotionConfig cfg;
    cfg.external_hold_default_seconds = 0.35f;
    LocomotionResolver loco(cfg);

    loco.hold_external_horizontal(JPH::Vec3(1.0f, 0.0f, 0.0f), 0.0f);
    REQUIRE(loco.is_holding_external());
    loco.resolve(JPH::Vec3::sZero(), flat_ground(), kUp, 0.3f);
    CHECK(loco.is_holding_external());
    loco.resolve(JPH::Vec3::sZero(), flat_ground(), kUp, 0.1f);
    CHECK_FALSE(loco.is_holding_external());

    loco.hold_external_horizontal(JPH::Vec3(1.0f, 0.0f, 0.0f), 1.0f);
    loco.cancel_external_horizontal_hold();
    CHECK_FALSE(loco.is_holding_external());
}

TEST_CASE("Locomotion - jump lockout leaves the launch velocity alone", "[locomotion]") {
    LocomotionConfig cfg;
    cfg.post_jump_move_lock_seconds = 0.18f;
    LocomotionResolver loco(cfg);
    loco.update_input(stick(0.0f, 1.0f), basis(JPH::Vec3::sAxisZ()), kUp, JPH::Vec3::sAxisZ());

    loco.notify_jumped();
    CHECK(loco.in_jump_lockout());

    // The probe may still see ground on the takeoff tick.
    JPH::Vec3 v = loco.resolve(JPH::Vec3(3.0f, 12.0f, 0.0f), flat_ground(), kUp, 1.0f / 60.0f);
    CHECK_FALSE(loco.is_grounded());
    check_vec(v, JPH::Vec3(3.0f, 12.0f, 0.0f));

    for (int i = 0; i < 12; ++i) loco.resolve(v, GroundContact{}, kUp, 1.0f / 60.0f);
    CHECK_FALSE(loco.in_jump_lockout());
}

// ---------------------------------------------------------------------------
// Free-look heading lock
// ---------------------------------------------------------------------------

TEST_CASE("Locomotion - free-look keeps the heading captured at entry", "[locomotion]") {
    LocomotionResolver loco;

    loco.update_input(stick(0.0f, 1.0f), basis(JPH::Vec3::sAxisZ(), true), kUp, JPH::Vec3::sAxisZ());
    CHECK(loco.is_free_look_locked());
    check_vec(loco.move_direction(), JPH::Vec3::sAxisZ());

    // Camera swings around; the character keeps going where it was going.
    loco.update_input(stick(0.0f, 1.0f), basis(JPH::Vec3::sAxisX(), true), kUp, JPH::Vec3::sAxisZ());
    check_vec(loco.move_direction(), JPH::Vec3::sAxisZ());

    SECTION("Entering free-look while standing still still locks") {
        loco.update_input(stick(0.0f, 0.0f), basis(JPH::Vec3::sAxisX(), true), kUp, JPH::Vec3::sAxisZ());
        loco.update_input(stick(0.0f, 1.0f), basis(-JPH::Vec3::sAxisZ(), true), kUp, JPH::Vec3::sAxisZ());
        check_vec(loco.move_direction(), JPH::Vec3::sAxisZ());
    }
}

TEST_CASE("Locomotion - free-look release while moving waits for the camera", "[locomotion]") {
    LocomotionConfig cfg;
    cfg.realign_seconds = 0.4f;
    LocomotionResolver loco(cfg);

    int                   requests = 0;
    float                 requested_seconds = 0.0f;
    std::function<void()> finish;
    loco.set_realign_request([&](float seconds, std::function<void()> on_complete) {
        ++requests;
        requested_seconds = seconds;
        finish = std::move(on_complete);
    });

    loco.update_input(stick(0.0f, 1.0f), basis(JPH::Vec3::sAxisZ(), true), kUp, JPH::Vec3::sAxisZ());
    loco.update_input(stick(0.0f, 1.0f), basis(JPH::Vec3::sAxisX(), true), kUp, JPH::Vec3::sAxisZ());

    // Release: the locked heading holds from this very frame.
    loco.update_input(stick(0.0f, 1.0f), basis(JPH::Vec3::sAxisX()), kUp, JPH::Vec3::sAxisZ());
    CHECK(requests == 1);
    CHECK(requested_seconds == 0.4f);
    CHECK(loco.is_waiting_for_realign());
    CHECK_FALSE(loco.is_free_look_locked());
    check_vec(loco.move_direction(), JPH::Vec3::sAxisZ());

    SECTION("Held while the camera is aligning") {
        loco.update_input(stick(0.0f, 1.0f), basis(JPH::Vec3::sAxisX(), false, true), kUp, JPH::Vec3::sAxisZ());
        check_vec(loco.move_direction(), JPH::Vec3::sAxisZ());

        REQUIRE(finish);
        finish();
        CHECK_FALSE(loco.is_waiting_for_realign());
        loco.update_input(stick(0.0f, 1.0f), basis(JPH::Vec3::sAxisX(), false, false), kUp, JPH::Vec3::sAxisZ());
        check_vec(loco.move_direction(), JPH::Vec3::sAxisX());
    }

    SECTION("Ends when the camera is no longer aligning") {
        loco.update_input(stick(0.0f, 1.0f), basis(JPH::Vec3::sAxisX(), false, false), kUp, JPH::Vec3::sAxisZ());
        CHECK_FALSE(loco.is_waiting_for_realign());
        check_vec(loco.move_direction(), JPH::Vec3::sAxisX());
    }

    SECTION("Ends when the stick is let go") {
        loco.update_input(stick(0.0f, 0.0f), basis(JPH::Vec3::sAxisX(), false, true), kUp, JPH::Vec3::sAxisZ());
        CHECK_FALSE(loco.is_waiting_for_realign());
        loco.update_input(stick(0.0f, 1.0f), basis(JPH::Vec3::sAxisX(), false, true), kUp, JPH::Vec3::sAxisZ());
        check_vec(loco.move_direction(), JPH::Vec3::sAxisX());
    }
}

TEST_CASE("Locomotion - free-look release while idle does not ask for a realign", "[locomotion]") {
    LocomotionResolver loco;
    int requests = 0;
    loco.set_realign_request([&](float, std::function<void()>) { ++requests; });

    loco.update_input(stick(0.0f, 0.0f), basis(JPH::Vec3::sAxisZ(), true), kUp, JPH::Vec3::sAxisZ());
    loco.update_input(stick(0.0f, 0.0f), basis(JPH::Vec3::sAxisX()), kUp, JPH::Vec3::sAxisZ());
    CHECK(requests == 0);
    CHECK_FALSE(loco.is_free_look_locked());
}

TEST_CASE("Locomotion - realign callback outliving the resolver is harmless", "[locomotion]") {
    std::function<void()> finish;
    auto loco = std::make_unique<LocomotionResolver>();
    loco->set_realign_request([&](float, std::function<void()> on_complete) { finish = std::move(on_complete); });

    loco->update_input(stick(0.0f, 1.0f), basis(JPH::Vec3::sAxisZ(), true), kUp, JPH::Vec3::sAxisZ());
    loco->update_input(stick(0.0f, 1.0f), basis(JPH::Vec3::sAxisX()), kUp, JPH::Vec3::sAxisZ());
    REQUIRE(finish);

    loco.reset();
    finish();
    SUCCEED();
}

TEST_CASE("Locomotion - reset clears every hold", "[locomotion]") {
    LocomotionResolver loco;
    loco.set_external_stop_movement(true);
    loco.hold_external_horizontal(JPH::Vec3(1.0f, 0.0f, 0.0f), 1.0f);
    loco.notify_jumped();
    loco.add_speed_modifier(3.0f);

    loco.reset();
    CHECK_FALSE(loco.is_externally_stopped());
    CHECK_FALSE(loco.is_holding_external());
    CHECK_FALSE(loco.in_jump_lockout());
    CHECK_THAT(loco.current_move_speed(), WithinAbs(loco.config().move_speed, 1e-5f));
}
