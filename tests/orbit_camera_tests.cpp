#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "../src/core/orbit_camera.hpp"
#include "../src/math_util.hpp"
#include <cmath>
#include <string>
#include <vector>

using namespace gravity;
using Catch::Matchers::WithinAbs;

namespace {

struct FakeCursor final : CursorControl {
    bool locked     = false;
    int  lock_calls = 0;
    std::vector<std::pair<float, float>> warps;

    bool is_locked() const override { return locked; }
    void set_locked(bool l) override {
        locked = l;
        ++lock_calls;
    }
    void warp(float x, float y) override { warps.emplace_back(x, y); }
};

struct Rig {
    FixedOrientationSource source;
    FakeCursor             cursor;
    OrbitCameraController  camera;

    explicit Rig(OrbitCameraConfig cfg = {}) : camera(cfg) {
        camera.set_orientation_source(&source);
        camera.set_cursor(&cursor);
    }
};

CameraFrameInput idle_frame(JPH::QuatArg facing = JPH::Quat::sIdentity()) {
    CameraFrameInput in;
    in.character.rotation = facing;
    return in;
}

CameraFrameInput press_primary(float dx = 0.0f, float dy = 0.0f) {
    CameraFrameInput in;
    in.primary.pressed = true;
    in.primary.held    = true;
    in.pointer_dx      = dx;
    in.pointer_dy      = dy;
    return in;
}

CameraFrameInput hold_primary(float dx = 0.0f, float dy = 0.0f) {
    CameraFrameInput in;
    in.primary.held = true;
    in.pointer_dx   = dx;
    in.pointer_dy   = dy;
    return in;
}

CameraFrameInput release_primary() {
    CameraFrameInput in;
    in.primary.released = true;
    return in;
}

JPH::Quat facing_x() { return JPH::Quat::sRotation(JPH::Vec3::sAxisY(), 0.5f * math::kPi); }

} // namespace

// ---------------------------------------------------------------------------
// Orbit input
// ---------------------------------------------------------------------------

TEST_CASE("OrbitCamera - first update snaps behind the character", "[orbit_camera]") {
    Rig rig;
    rig.camera.update(idle_frame(facing_x()), 0.016f);
    CHECK_THAT(rig.camera.yaw(), WithinAbs(-90.0f, 1e-3f));
    CHECK_THAT(rig.camera.pitch(), WithinAbs(-10.0f, 1e-4f));
    CHECK(rig.camera.camera_forward().GetX() > 0.9f);
    CHECK(rig.camera.pan_mode() == PanMode::Idle);
}

TEST_CASE("OrbitCamera - primary drag orbits by pointer delta * sensitivity * dt", "[orbit_camera]") {
    Rig rig;
    rig.camera.update(idle_frame(), 0.1f);
    REQUIRE(rig.camera.yaw() == 0.0f);

    rig.camera.update(press_primary(10.0f, 0.0f), 0.1f);
    CHECK(rig.camera.pan_mode() == PanMode::PrimaryOrbit);
    CHECK(rig.camera.is_panning_active());
    CHECK_THAT(rig.camera.yaw(), WithinAbs(2.0f, 1e-5f));
    CHECK(rig.cursor.locked);

    // Positive yaw turns the view to the right.
    CHECK(rig.camera.camera_forward().Dot(JPH::Vec3(-1.0f, 0.0f, 0.0f)) > 0.0f);
}

TEST_CASE("OrbitCamera - pitch is clamped to max_pitch", "[orbit_camera]") {
    Rig rig;
    rig.camera.update(idle_frame(), 0.1f);
    rig.camera.update(press_primary(0.0f, 1000.0f), 0.1f);
    CHECK_THAT(rig.camera.pitch(), WithinAbs(60.0f, 1e-4f));

    rig.camera.update(hold_primary(0.0f, -5000.0f), 0.1f);
    CHECK_THAT(rig.camera.pitch(), WithinAbs(-60.0f, 1e-4f));
    CHECK_THAT(math::elevation(rig.camera.camera_forward(), JPH::Vec3::sAxisY()), WithinAbs(-60.0f, 1e-2f));
}

TEST_CASE("OrbitCamera - presses over UI are ignored", "[orbit_camera]") {
    Rig rig;
    rig.camera.update(idle_frame(), 0.1f);

    CameraFrameInput in = press_primary(10.0f, 0.0f);
    in.pointer_over_ui  = true;
    rig.camera.update(in, 0.1f);
    CHECK(rig.camera.pan_mode() == PanMode::Idle);
    CHECK(rig.camera.yaw() == 0.0f);
}

TEST_CASE("OrbitCamera - releasing a pan restores and warps the cursor", "[orbit_camera]") {
    Rig rig;
    rig.camera.update(idle_frame(), 0.1f);

    CameraFrameInput press = press_primary(5.0f, 0.0f);
    press.pointer_x = 320.0f;
    press.pointer_y = 200.0f;
    rig.camera.update(press, 0.1f);
    REQUIRE(rig.cursor.locked);

    rig.camera.update(release_primary(), 0.1f);
    CHECK(rig.camera.pan_mode() == PanMode::Idle);
    CHECK_FALSE(rig.cursor.locked);
    REQUIRE(rig.cursor.warps.size() == 1);
    CHECK(rig.cursor.warps[0].first == 320.0f);
    CHECK(rig.cursor.warps[0].second == 200.0f);
}

// ---------------------------------------------------------------------------
// Button precedence
// ---------------------------------------------------------------------------

TEST_CASE("OrbitCamera - both buttons: the most recent press wins", "[orbit_camera]") {
    Rig rig;
    rig.camera.update(idle_frame(), 0.1f);

    SECTION("Secondary pressed after primary") {
        rig.camera.update(press_primary(), 0.1f);
        REQUIRE(rig.camera.pan_mode() == PanMode::PrimaryOrbit);

        CameraFrameInput both = hold_primary();
        both.secondary.pressed = true;
        both.secondary.held    = true;
        rig.camera.update(both, 0.1f);
        CHECK(rig.camera.pan_mode() == PanMode::SecondaryFreeLook);
        CHECK(rig.camera.is_free_look_only_active());
        CHECK_FALSE(rig.camera.is_panning_active());

        CameraFrameInput drop = hold_primary();
        drop.secondary.released = true;
        rig.camera.update(drop, 0.1f);
        CHECK(rig.camera.pan_mode() == PanMode::PrimaryOrbit);
    }

    SECTION("Same-frame presses resolve to primary") {
        CameraFrameInput both = press_primary();
        both.secondary.pressed = true;
        both.secondary.held    = true;
        rig.camera.update(both, 0.1f);
        CHECK(rig.camera.pan_mode() == PanMode::PrimaryOrbit);
    }
}

TEST_CASE("OrbitCamera - releasing the winning button hands over to the one still held", "[orbit_camera]") {
    Rig rig;
    rig.camera.update(idle_frame(), 0.1f);

    CameraFrameInput look;
    look.secondary.pressed = true;
    look.secondary.held    = true;
    rig.camera.update(look, 0.1f);
    REQUIRE(rig.camera.pan_mode() == PanMode::SecondaryFreeLook);

    CameraFrameInput both = press_primary(150.0f, 0.0f);
    both.secondary.held   = true;
    rig.camera.update(both, 0.1f);
    REQUIRE(rig.camera.pan_mode() == PanMode::PrimaryOrbit);
    REQUIRE_THAT(rig.camera.yaw(), WithinAbs(30.0f, 1e-4f));

    CameraFrameInput drop;
    drop.primary.released = true;
    drop.secondary.held   = true;
    rig.camera.update(drop, 0.1f);
    CHECK(rig.camera.pan_mode() == PanMode::SecondaryFreeLook);
    CHECK(rig.camera.is_free_look_only_active());
    CHECK_FALSE(rig.camera.is_panning_active());
    CHECK(rig.cursor.locked);

    CameraFrameInput drag;
    drag.secondary.held = true;
    drag.pointer_dx     = -100.0f;
    rig.camera.update(drag, 0.1f);
    CHECK_THAT(rig.camera.yaw(), WithinAbs(10.0f, 1e-4f));

    // The free-look seat is the one taken at the handover, not at the first press.
    CameraFrameInput release;
    release.secondary.released = true;
    rig.camera.update(release, 0.1f);
    REQUIRE(rig.camera.is_auto_aligning());
    for (int i = 0; i < 6; ++i) rig.camera.update(idle_frame(), 0.1f);
    CHECK_FALSE(rig.camera.is_auto_aligning());
    CHECK_THAT(rig.camera.yaw(), WithinAbs(30.0f, 1e-3f));
    CHECK_FALSE(rig.cursor.locked);
}

// ---------------------------------------------------------------------------
// Zoom
// ---------------------------------------------------------------------------

TEST_CASE("OrbitCamera - zoom steps differ in and out", "[orbit_camera]") {
    Rig rig;
    rig.camera.update(idle_frame(), 0.1f);
    REQUIRE_THAT(rig.camera.zoom_percent(), WithinAbs(0.5f, 1e-6f));

    CameraFrameInput in = idle_frame();
    in.scroll = 1.0f;
    rig.camera.update(in, 0.1f);
    CHECK_THAT(rig.camera.zoom_percent(), WithinAbs(0.5f - 1.0f / 15.0f, 1e-5f));

    CameraFrameInput out = idle_frame();
    out.scroll = -1.0f;
    rig.camera.update(out, 0.1f);
    CHECK_THAT(rig.camera.zoom_percent(), WithinAbs(0.5f - 1.0f / 15.0f + 1.0f / 20.0f, 1e-5f));

    // One in and one out does not return to where it started.
    CHECK(std::abs(rig.camera.zoom_percent() - 0.5f) > 0.01f);

    SECTION("Distance follows the exponent curve") {
        float p = rig.camera.zoom_percent();
        CHECK_THAT(rig.camera.target_zoom_distance(),
                   WithinAbs(0.1f + 49.9f * std::pow(p, 1.5f), 1e-3f));
    }
}

TEST_CASE("OrbitCamera - zooming fully in enters first person", "[orbit_camera]") {
    OrbitCameraConfig cfg;
    cfg.zoom_smoothing = 1000.0f;
    Rig rig(cfg);

    std::vector<bool> changes;
    rig.camera.set_first_person_listener([&](bool fp) { changes.push_back(fp); });
    rig.camera.update(idle_frame(), 0.1f);

    CameraFrameInput in = idle_frame();
    in.scroll = 1.0f;
    for (int i = 0; i < 20; ++i) rig.camera.update(in, 0.1f);

    CHECK(rig.camera.zoom_percent() == 0.0f);
    CHECK(rig.camera.is_in_first_person());
    CHECK(rig.cursor.locked);
    REQUIRE(changes.size() == 1);
    CHECK(changes[0]);

    CameraFrameInput out = idle_frame();
    out.scroll = -1.0f;
    rig.camera.update(out, 0.1f);
    CHECK_FALSE(rig.camera.is_in_first_person());
    CHECK_FALSE(rig.cursor.locked);
    REQUIRE(changes.size() == 2);
    CHECK_FALSE(changes[1]);
}

TEST_CASE("OrbitCamera - reset out of first person notifies and frees the cursor", "[orbit_camera]") {
    OrbitCameraConfig cfg;
    cfg.zoom_smoothing = 1000.0f;
    Rig rig(cfg);

    std::vector<bool> changes;
    rig.camera.set_first_person_listener([&](bool fp) { changes.push_back(fp); });
    rig.camera.update(idle_frame(), 0.1f);

    CameraFrameInput in = idle_frame();
    in.scroll = 1.0f;
    for (int i = 0; i < 20; ++i) rig.camera.update(in, 0.1f);
    REQUIRE(rig.camera.is_in_first_person());
    REQUIRE(rig.cursor.locked);

    rig.camera.reset();
    CHECK_FALSE(rig.camera.is_in_first_person());
    CHECK_FALSE(rig.cursor.locked);
    CHECK((changes == std::vector<bool>{true, false}));

    rig.camera.update(idle_frame(), 0.1f);
    CHECK_FALSE(rig.camera.is_in_first_person());
    CHECK_FALSE(rig.cursor.locked);
    CHECK(changes.size() == 2);
    CHECK_THAT(rig.camera.zoom_percent(), WithinAbs(0.5f, 1e-6f));
}

// ---------------------------------------------------------------------------
// Alignment
// ---------------------------------------------------------------------------

TEST_CASE("OrbitCamera - auto-align eases behind the character", "[orbit_camera]") {
    Rig once;
    Rig twice;
    once.camera.update(idle_frame(), 0.1f);
    twice.camera.update(idle_frame(), 0.1f);
    once.camera.update(idle_frame(facing_x()), 0.1f);
    twice.camera.update(idle_frame(facing_x()), 0.1f);

    int first_done  = 0;
    int second_done = 0;
    once.camera.start_auto_align_behind_character(0.5f, [&] { ++second_done; });
    twice.camera.start_auto_align_behind_character(0.5f, [&] { ++first_done; });
    twice.camera.start_auto_align_behind_character(0.5f, [&] { ++second_done; });
    CHECK(twice.camera.is_auto_aligning());

    for (int i = 0; i < 10; ++i) {
        once.camera.update(idle_frame(facing_x()), 0.1f);
        twice.camera.update(idle_frame(facing_x()), 0.1f);
        CHECK(once.camera.yaw() == twice.camera.yaw());
    }

    CHECK_THAT(twice.camera.yaw(), WithinAbs(-90.0f, 1e-3f));
    CHECK_FALSE(twice.camera.is_auto_aligning());
    CHECK(first_done == 0);
    CHECK(second_done == 2);   // one per camera
}

TEST_CASE("OrbitCamera - idle after an orbit swings back behind the character", "[orbit_camera]") {
    Rig rig;
    rig.camera.update(idle_frame(), 0.1f);
    rig.camera.update(press_primary(150.0f, 0.0f), 0.1f);
    REQUIRE_THAT(rig.camera.yaw(), WithinAbs(30.0f, 1e-4f));
    rig.camera.update(release_primary(), 0.1f);

    for (int i = 0; i < 10; ++i) rig.camera.update(idle_frame(), 0.1f);
    CHECK_THAT(rig.camera.yaw(), WithinAbs(30.0f, 1e-4f));

    for (int i = 0; i < 20; ++i) rig.camera.update(idle_frame(), 0.1f);
    CHECK_THAT(rig.camera.yaw(), WithinAbs(0.0f, 1e-3f));
}

TEST_CASE("OrbitCamera - input resuming stops the swing back where it is", "[orbit_camera]") {
    Rig rig;
    rig.camera.update(idle_frame(), 0.1f);
    rig.camera.update(press_primary(150.0f, 0.0f), 0.1f);
    rig.camera.update(release_primary(), 0.1f);
    REQUIRE_THAT(rig.camera.yaw(), WithinAbs(30.0f, 1e-4f));

    SECTION("During the idle countdown") {
        for (int i = 0; i < 5; ++i) rig.camera.update(idle_frame(), 0.1f);
        rig.camera.update(press_primary(), 0.1f);
        for (int i = 0; i < 30; ++i) rig.camera.update(hold_primary(), 0.1f);
        CHECK_FALSE(rig.camera.is_auto_aligning());
        CHECK_THAT(rig.camera.yaw(), WithinAbs(30.0f, 1e-4f));

        // Releasing again restarts the countdown from the top.
        rig.camera.update(release_primary(), 0.1f);
        for (int i = 0; i < 15; ++i) rig.camera.update(idle_frame(), 0.1f);
        CHECK_FALSE(rig.camera.is_auto_aligning());
        CHECK_THAT(rig.camera.yaw(), WithinAbs(30.0f, 1e-4f));
    }

    SECTION("During the ease") {
        rig.camera.update(idle_frame(), 1.85f);
        rig.camera.update(idle_frame(), 0.1f);
        REQUIRE(rig.camera.is_auto_aligning());
        const float partial = rig.camera.yaw();
        REQUIRE(partial > 1.0f);
        REQUIRE(partial < 29.0f);

        rig.camera.update(press_primary(), 0.1f);
        CHECK_FALSE(rig.camera.is_auto_aligning());
        CHECK_THAT(rig.camera.yaw(), WithinAbs(partial, 1e-4f));

        for (int i = 0; i < 10; ++i) rig.camera.update(hold_primary(), 0.1f);
        CHECK_THAT(rig.camera.yaw(), WithinAbs(partial, 1e-4f));
    }

    SECTION("First-person mouse look during the ease") {
        OrbitCameraConfig cfg;
        cfg.zoom_smoothing     = 1000.0f;
        cfg.start_zoom_percent = 0.0f;
        Rig fp(cfg);
        fp.camera.update(idle_frame(), 0.1f);
        REQUIRE(fp.camera.is_in_first_person());
        fp.camera.update(press_primary(150.0f, 0.0f), 0.1f);
        fp.camera.update(release_primary(), 0.1f);
        fp.camera.update(idle_frame(), 1.85f);
        fp.camera.update(idle_frame(), 0.1f);
        REQUIRE(fp.camera.is_auto_aligning());
        const float eased = fp.camera.yaw();

        CameraFrameInput look = idle_frame();
        look.pointer_dx = 5.0f;
        fp.camera.update(look, 0.1f);
        CHECK_FALSE(fp.camera.is_auto_aligning());
        CHECK_THAT(fp.camera.yaw(), WithinAbs(eased + 1.0f, 1e-4f));
    }
}

TEST_CASE("OrbitCamera - free-look returns to the seat it started from", "[orbit_camera]") {
    Rig rig;
    rig.camera.update(idle_frame(), 0.1f);
    rig.camera.update(press_primary(150.0f, 0.0f), 0.1f);
    rig.camera.update(release_primary(), 0.1f);
    REQUIRE_THAT(rig.camera.yaw(), WithinAbs(30.0f, 1e-4f));

    CameraFrameInput press;
    press.secondary.pressed = true;
    press.secondary.held    = true;
    press.pointer_dx        = -100.0f;
    rig.camera.update(press, 0.1f);
    CHECK(rig.camera.is_free_look_only_active());
    CHECK_THAT(rig.camera.yaw(), WithinAbs(10.0f, 1e-4f));

    CameraFrameInput release;
    release.secondary.released = true;
    rig.camera.update(release, 0.1f);
    CHECK(rig.camera.is_auto_aligning());

    for (int i = 0; i < 6; ++i) rig.camera.update(idle_frame(), 0.1f);
    CHECK_FALSE(rig.camera.is_auto_aligning());
    CHECK_THAT(rig.camera.yaw(), WithinAbs(30.0f, 1e-3f));
}

// ---------------------------------------------------------------------------
// Externally driven
// ---------------------------------------------------------------------------

TEST_CASE("OrbitCamera - externally driven mode", "[orbit_camera]") {
    Rig rig;

    SECTION("Round trip from an unlocked cursor") {
        CameraFrameInput f = idle_frame();
        f.pointer_x = 50.0f;
        f.pointer_y = 60.0f;
        rig.camera.update(f, 0.1f);

        rig.camera.set_panning_active(true);
        CHECK(rig.camera.pan_mode() == PanMode::ExternallyDriven);
        CHECK(rig.camera.is_panning_active());
        CHECK(rig.cursor.locked);

        rig.camera.set_panning_active(false);
        CHECK(rig.camera.pan_mode() == PanMode::Idle);
        CHECK_FALSE(rig.cursor.locked);
        REQUIRE(rig.cursor.warps.size() == 1);
        CHECK(rig.cursor.warps[0].first == 50.0f);
    }

    SECTION("Round trip from a locked cursor") {
        rig.cursor.locked = true;
        rig.camera.update(idle_frame(), 0.1f);
        rig.camera.set_panning_active(true);
        rig.camera.set_panning_active(false);
        CHECK(rig.cursor.locked);
        CHECK(rig.cursor.warps.empty());
    }

    SECTION("Input is ignored while driven") {
        rig.camera.update(idle_frame(), 0.1f);
        rig.camera.set_panning_active(true);

        CameraFrameInput in = press_primary(100.0f, 100.0f);
        in.scroll = 1.0f;
        rig.camera.update(in, 0.1f);
        CHECK(rig.camera.yaw() == 0.0f);
        CHECK_THAT(rig.camera.pitch(), WithinAbs(-10.0f, 1e-5f));
        CHECK_THAT(rig.camera.zoom_percent(), WithinAbs(0.5f, 1e-6f));
        CHECK(rig.camera.pan_mode() == PanMode::ExternallyDriven);

        SECTION("Release falls back to the held button") {
            rig.camera.set_panning_active(false);
            CHECK(rig.camera.pan_mode() == PanMode::PrimaryOrbit);
            CHECK(rig.cursor.locked);
        }

        SECTION("Forced release always goes idle") {
            rig.camera.set_panning_active(false, true);
            CHECK(rig.camera.pan_mode() == PanMode::Idle);
            CHECK_FALSE(rig.cursor.locked);
        }
    }

    SECTION("Release without a prior grab does nothing") {
        rig.camera.update(idle_frame(), 0.1f);
        rig.camera.set_panning_active(false);
        CHECK(rig.camera.pan_mode() == PanMode::Idle);
        CHECK(rig.cursor.lock_calls == 0);
    }
}

// ---------------------------------------------------------------------------
// Gravity transitions
// ---------------------------------------------------------------------------

TEST_CASE("OrbitCamera - flipping gravity puts the camera behind the character", "[orbit_camera]") {
    Rig rig;
    // Character upside down, facing -Z.
    const JPH::Quat flipped = JPH::Quat::sRotation(JPH::Vec3::sAxisX(), math::kPi);
    rig.camera.update(idle_frame(flipped), 0.05f);

    rig.camera.on_gravity_transition_started();
    rig.source.set_up(-JPH::Vec3::sAxisY());
    rig.camera.on_gravity_transition_completed();

    CHECK_THAT(std::abs(rig.camera.yaw()), WithinAbs(180.0f, 1e-3f));
    CHECK_THAT(rig.camera.pitch(), WithinAbs(-10.0f, 1e-4f));
    CHECK(rig.camera.is_stabilizing());

    // Input is dropped while the frame settles.
    CameraFrameInput drag = press_primary(100.0f, 0.0f);
    drag.character.rotation = flipped;
    const float yaw_before = rig.camera.yaw();
    rig.camera.update(drag, 0.05f);
    CHECK(rig.camera.yaw() == yaw_before);

    const JPH::Vec3 fwd = rig.camera.camera_forward();
    CHECK(fwd.GetZ() < -0.95f);
    CHECK_THAT(math::elevation(fwd, -JPH::Vec3::sAxisY()), WithinAbs(-10.0f, 1e-2f));
    CHECK(rig.camera.camera_up().Dot(-JPH::Vec3::sAxisY()) > 0.95f);
}

TEST_CASE("OrbitCamera - minor gravity change keeps the seat", "[orbit_camera]") {
    Rig rig;
    rig.camera.update(idle_frame(), 0.05f);
    REQUIRE(rig.camera.yaw() == 0.0f);

    const JPH::Vec3 tilted = JPH::Quat::sRotation(JPH::Vec3::sAxisZ(), 30.0f * math::kDegToRad) *
                             JPH::Vec3::sAxisY();
    rig.camera.on_gravity_transition_started();
    rig.source.set_up(tilted);
    rig.camera.on_gravity_transition_completed();

    CHECK_THAT(rig.camera.yaw(), WithinAbs(0.0f, 1e-2f));
    CHECK_THAT(rig.camera.pitch(), WithinAbs(-10.0f, 1e-2f));
    CHECK(rig.camera.current_up().Dot(tilted) > 0.9999f);
}

TEST_CASE("OrbitCamera - sub-degree up changes never touch yaw or pitch", "[orbit_camera]") {
    Rig rig;
    rig.camera.update(idle_frame(), 0.05f);
    rig.camera.update(press_primary(37.0f, 13.0f), 0.05f);
    rig.camera.update(release_primary(), 0.05f);
    const float yaw   = rig.camera.yaw();
    const float pitch = rig.camera.pitch();

    const JPH::Vec3 noisy = JPH::Quat::sRotation(JPH::Vec3::sAxisZ(), 0.5f * math::kDegToRad) *
                            JPH::Vec3::sAxisY();
    rig.camera.on_gravity_transition_started();
    rig.source.set_up(noisy);
    rig.camera.on_gravity_transition_completed();
    CHECK_FALSE(rig.camera.is_stabilizing());
    CHECK(rig.camera.yaw() == yaw);
    CHECK(rig.camera.pitch() == pitch);

    rig.camera.update(idle_frame(), 0.05f);
    CHECK(rig.camera.yaw() == yaw);
    CHECK(rig.camera.pitch() == pitch);
    CHECK(rig.camera.current_up() == JPH::Vec3::sAxisY());
}

TEST_CASE("OrbitCamera - up crossing the yaw reference pole keeps the view continuous", "[orbit_camera]") {
    Rig rig;
    rig.source.set_up(JPH::Vec3(0.01f, 0.0f, 1.0f).Normalized());
    rig.camera.update(idle_frame(), 0.05f);
    const JPH::Vec3 before = rig.camera.camera_forward();

    // The yaw zero flips from -X to +X across this step.
    const JPH::Vec3 crossed = JPH::Vec3(-0.02f, 0.0f, 1.0f).Normalized();
    rig.source.set_up(crossed);
    rig.camera.update(idle_frame(), 0.05f);

    CHECK(rig.camera.current_up().Dot(crossed) > 0.9999f);
    CHECK(rig.camera.camera_forward().Dot(before) > 0.99f);
    CHECK(std::abs(rig.camera.yaw()) > 170.0f);
    CHECK_THAT(rig.camera.pitch(), WithinAbs(math::elevation(before, crossed), 1e-2f));

    // Further frames on the same up hold the view.
    const JPH::Vec3 settled = rig.camera.camera_forward();
    rig.camera.update(idle_frame(), 0.05f);
    CHECK(rig.camera.camera_forward().Dot(settled) > 0.9999f);
}

TEST_CASE("OrbitCamera - releasing a zero-g pan pins the orientation source", "[orbit_camera]") {
    Rig rig;
    rig.source.set_unconstrained(true);
    rig.camera.update(idle_frame(), 0.1f);

    rig.camera.update(press_primary(100.0f, 50.0f), 0.1f);
    rig.camera.update(hold_primary(100.0f, 400.0f), 0.1f);
    // No pitch clamp in zero-g.
    const JPH::Vec3 cam_up = rig.camera.camera_up();
    CHECK(cam_up.Dot(JPH::Vec3::sAxisY()) < 0.99f);

    rig.camera.update(release_primary(), 0.1f);
    CHECK(rig.source.freeze_count() == 1);
    CHECK(rig.source.frame().up.Dot(cam_up) > 0.9999f);
    CHECK_FALSE(rig.cursor.locked);

    // Idle in zero-g holds the rotation as it is.
    const JPH::Vec3 held = rig.camera.camera_forward();
    for (int i = 0; i < 30; ++i) rig.camera.update(idle_frame(), 0.1f);
    CHECK(rig.camera.camera_forward().Dot(held) > 0.9999f);
}

TEST_CASE("OrbitCamera - force_orientation_update levels the camera", "[orbit_camera]") {
    Rig rig;
    rig.camera.update(idle_frame(), 0.1f);
    rig.camera.force_orientation_update(JPH::Vec3::sAxisX());
    CHECK(rig.camera.current_up() == JPH::Vec3::sAxisX());
    CHECK(rig.camera.pitch() == 0.0f);
    CHECK_THAT(rig.camera.camera_forward().Dot(JPH::Vec3::sAxisX()), WithinAbs(0.0f, 1e-4f));
}

// ---------------------------------------------------------------------------
// Collision mask and offsets
// ---------------------------------------------------------------------------

TEST_CASE("OrbitCamera - phase ignore restores the exact previous mask", "[orbit_camera]") {
    SECTION("Default mask") {
        OrbitCameraController camera;
        camera.set_collision_mask_phase_ignore(true);
        CHECK((camera.collision_mask() & QueryLayers::Phase) == 0u);
        camera.set_collision_mask_phase_ignore(false);
        CHECK(camera.collision_mask() == QueryLayers::All);
    }

    SECTION("Custom mask, repeated calls") {
        OrbitCameraConfig cfg;
        cfg.obstruction_mask = QueryLayers::Static | QueryLayers::Phase;
        OrbitCameraController camera(cfg);

        camera.set_collision_mask_phase_ignore(true);
        camera.set_collision_mask_phase_ignore(true);
        CHECK(camera.collision_mask() == QueryLayers::Static);

        camera.set_collision_mask_phase_ignore(false);
        CHECK(camera.collision_mask() == (QueryLayers::Static | QueryLayers::Phase));
        camera.set_collision_mask_phase_ignore(false);
        CHECK(camera.collision_mask() == (QueryLayers::Static | QueryLayers::Phase));
    }
}

TEST_CASE("OrbitCamera - external offsets apply for one frame", "[orbit_camera]") {
    Rig rig;
    rig.camera.update(idle_frame(), 0.1f);
    const JPH::Vec3 base = rig.camera.camera_position();

    rig.camera.set_external_camera_offset(JPH::Vec3(1.0f, 0.0f, 0.0f));
    rig.camera.set_external_camera_offset(JPH::Vec3(0.0f, 0.5f, 0.0f));
    rig.camera.update(idle_frame(), 0.1f);
    const JPH::Vec3 shifted = rig.camera.camera_position() - base;
    CHECK_THAT(shifted.GetX(), WithinAbs(1.0f, 1e-4f));
    CHECK_THAT(shifted.GetY(), WithinAbs(0.5f, 1e-4f));

    rig.camera.update(idle_frame(), 0.1f);
    CHECK((rig.camera.camera_position() - base).Length() < 1e-4f);
}

TEST_CASE("OrbitCamera - pivot uses the character-local target offset", "[orbit_camera]") {
    Rig rig;
    CameraFrameInput in = idle_frame(JPH::Quat::sRotation(JPH::Vec3::sAxisZ(), 0.5f * math::kPi));
    in.character.position = JPH::Vec3(3.0f, 0.0f, 0.0f);
    rig.camera.update(in, 0.1f);

    // Rolled 90 deg about Z: local +Y points at world -X.
    CHECK_THAT(rig.camera.pivot().GetX(), WithinAbs(1.5f, 1e-4f));
    CHECK_THAT(rig.camera.pivot().GetY(), WithinAbs(0.0f, 1e-4f));
}

TEST_CASE("OrbitCamera - pan mode names", "[orbit_camera]") {
    CHECK(std::string(pan_mode_name(PanMode::PrimaryOrbit)) == "Orbit");
    CHECK(std::string(pan_mode_name(PanMode::ExternallyDriven)) == "External");
}
