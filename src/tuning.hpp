#pragma once
#include "core/gravity_field.hpp"
#include "core/ground_probe.hpp"
#include "core/locomotion.hpp"
#include "core/orbit_camera.hpp"

// ---------------------------------------------------------------------------
// TuningConfig - world resource holding the camera, locomotion, ground probe
// and gravity settings read from the scene file. Characters pick it up when
// they are created; CameraModule and GravityModule push it to their
// controllers after every scene load.
// ---------------------------------------------------------------------------

struct TuningConfig {
    gravity::OrbitCameraConfig  camera;
    gravity::LocomotionConfig   locomotion;
    gravity::GroundProbeConfig  probe;
    gravity::GravityFieldConfig field;
};
