#pragma once
#include <ecs/ecs.hpp>
#include <string>

struct TuningConfig;

// ---------------------------------------------------------------------------
// SceneLoader - reads JSON scene files and populates an ECS World.
//
// A scene holds an "entities" array plus optional tuning blocks ("camera",
// "locomotion", "ground_probe", "gravity"). Tuning is applied to the world's
// TuningConfig resource, when there is one, before any entity spawns so the
// character hooks pick it up.
//
// Components are added in lifecycle-safe order (colliders before rigid_body,
// transform before character) so on_add hooks fire with sibling data present.
// No Raylib dependency - compilable in the headless test target.
// ---------------------------------------------------------------------------

class SceneLoader {
public:
    // Load entities from a JSON file into world.
    // Returns false if the file cannot be opened or the JSON is malformed.
    static bool load(ecs::World& world, const std::string& path);

    // Parse and spawn from a JSON string - identical to load() but avoids
    // file I/O. Intended for unit testing.
    static bool load_from_string(ecs::World& world, const std::string& json);

    // Parse only the tuning blocks into config. Missing keys keep their
    // current values. Returns false on malformed JSON or mistyped values.
    static bool load_config_from_string(const std::string& json, TuningConfig& config);

    // Destroy all WorldTag entities and flush deferred commands.
    static void unload(ecs::World& world);
};
