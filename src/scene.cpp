#include "scene.hpp"
#include "components.hpp"
#include "tuning.hpp"
#include <ecs/modules/transform.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using json = nlohmann::json;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static ecs::Vec3 parse_vec3(const json& j) {
    return {j[0].get<float>(), j[1].get<float>(), j[2].get<float>()};
}

static ecs::Quat parse_quat(const json& j) {
    // stored as [x, y, z, w]
    return {j[0].get<float>(), j[1].get<float>(), j[2].get<float>(), j[3].get<float>()};
}

static Color4 parse_color4(const json& j) {
    return {j[0].get<float>(), j[1].get<float>(), j[2].get<float>(), j[3].get<float>()};
}

static ShapeType parse_shape(const std::string& s) {
    if (s == "Box")     return ShapeType::Box;
    if (s == "Sphere")  return ShapeType::Sphere;
    if (s == "Capsule") return ShapeType::Capsule;
    throw std::runtime_error("SceneLoader: unknown shape '" + s + "'");
}

static BodyType parse_body_type(const std::string& s) {
    if (s == "Static")    return BodyType::Static;
    if (s == "Dynamic")   return BodyType::Dynamic;
    if (s == "Kinematic") return BodyType::Kinematic;
    throw std::runtime_error("SceneLoader: unknown body type '" + s + "'");
}

static GravityZoneShape parse_zone_shape(const std::string& s) {
    if (s == "Box")    return GravityZoneShape::Box;
    if (s == "Sphere") return GravityZoneShape::Sphere;
    throw std::runtime_error("SceneLoader: unknown gravity zone shape '" + s + "'");
}

static GravityZoneMode parse_zone_mode(const std::string& s) {
    if (s == "Directional") return GravityZoneMode::Directional;
    if (s == "Point")       return GravityZoneMode::Point;
    throw std::runtime_error("SceneLoader: unknown gravity zone mode '" + s + "'");
}

// Overwrites target only when key is present.
template <typename T>
static void read_opt(const json& j, const char* key, T& target) {
    if (j.contains(key)) target = j[key].get<T>();
}

// ---------------------------------------------------------------------------
// Tuning blocks
// ---------------------------------------------------------------------------

static void parse_camera(const json& c, gravity::OrbitCameraConfig& cfg) {
    read_opt(c, "min_zoom",                 cfg.min_zoom);
    read_opt(c, "max_zoom",                 cfg.max_zoom);
    read_opt(c, "zoom_in_ticks",            cfg.zoom_in_ticks);
    read_opt(c, "zoom_out_ticks",           cfg.zoom_out_ticks);
    read_opt(c, "zoom_smoothing",           cfg.zoom_smoothing);
    read_opt(c, "zoom_exponent",            cfg.zoom_exponent);
    read_opt(c, "start_zoom_percent",       cfg.start_zoom_percent);
    read_opt(c, "first_person_margin",      cfg.first_person_margin);
    read_opt(c, "pan_sensitivity",          cfg.pan_sensitivity);
    read_opt(c, "max_pitch",                cfg.max_pitch_deg);
    read_opt(c, "default_pitch",            cfg.default_pitch_deg);
    read_opt(c, "collision_buffer",         cfg.collision_buffer);
    read_opt(c, "probe_radius",             cfg.probe_radius);
    read_opt(c, "collision_quality",        cfg.collision_quality);
    read_opt(c, "ring_min_distance",        cfg.ring_min_distance);
    read_opt(c, "stabilization_seconds",    cfg.stabilization_seconds);
    read_opt(c, "significant_change_dot",   cfg.significant_change_dot);
    read_opt(c, "transition_pitch",         cfg.transition_pitch_deg);
    read_opt(c, "auto_align_idle_seconds",  cfg.auto_align_idle_seconds);
    read_opt(c, "auto_align_seconds",       cfg.auto_align_seconds);
    read_opt(c, "free_look_return_seconds", cfg.free_look_return_seconds);
    if (c.contains("target_offset")) {
        ecs::Vec3 o = parse_vec3(c["target_offset"]);
        cfg.target_offset = JPH::Vec3(o.x, o.y, o.z);
    }

    // Out-of-range values fall back instead of failing the load.
    if (cfg.zoom_exponent < 1.0f) {
        std::cerr << "[Scene] camera.zoom_exponent " << cfg.zoom_exponent
                  << " below 1, using 1" << std::endl;
        cfg.zoom_exponent = 1.0f;
    }
    if (cfg.min_zoom > cfg.max_zoom) {
        std::cerr << "[Scene] camera.min_zoom > max_zoom, swapping" << std::endl;
        std::swap(cfg.min_zoom, cfg.max_zoom);
    }
    if (cfg.zoom_in_ticks < 1) {
        std::cerr << "[Scene] camera.zoom_in_ticks below 1, using 1" << std::endl;
        cfg.zoom_in_ticks = 1;
    }
    if (cfg.zoom_out_ticks < 1) {
        std::cerr << "[Scene] camera.zoom_out_ticks below 1, using 1" << std::endl;
        cfg.zoom_out_ticks = 1;
    }
}

static void parse_locomotion(const json& l, gravity::LocomotionConfig& cfg) {
    read_opt(l, "move_speed",                    cfg.move_speed);
    read_opt(l, "min_move_speed",                cfg.min_move_speed);
    read_opt(l, "ground_accel",                  cfg.ground_accel);
    read_opt(l, "air_accel",                     cfg.air_accel);
    read_opt(l, "ground_friction_damp",          cfg.ground_friction_damp);
    read_opt(l, "slide_accel",                   cfg.slide_accel);
    read_opt(l, "slide_max_speed",               cfg.slide_max_speed);
    read_opt(l, "post_jump_move_lock_seconds",   cfg.post_jump_move_lock_seconds);
    read_opt(l, "external_hold_default_seconds", cfg.external_hold_default_seconds);
    read_opt(l, "realign_seconds",               cfg.realign_seconds);
}

static void parse_ground_probe(const json& p, gravity::GroundProbeConfig& cfg) {
    read_opt(p, "max_slope",            cfg.max_slope_deg);
    read_opt(p, "hysteresis",           cfg.hysteresis_deg);
    read_opt(p, "ground_check_radius",  cfg.ground_check_radius);
    read_opt(p, "probe_extra_distance", cfg.probe_extra_distance);
    read_opt(p, "underfoot_tolerance",  cfg.underfoot_tolerance);
    read_opt(p, "jump_grace_seconds",   cfg.jump_grace_seconds);
}

static void parse_gravity(const json& g, gravity::GravityFieldConfig& cfg) {
    read_opt(g, "transition_dot",   cfg.transition_dot);
    read_opt(g, "default_strength", cfg.default_strength);
}

static void parse_tuning(const json& scene, TuningConfig& config) {
    if (scene.contains("camera"))       parse_camera(scene["camera"], config.camera);
    if (scene.contains("locomotion"))   parse_locomotion(scene["locomotion"], config.locomotion);
    if (scene.contains("ground_probe")) parse_ground_probe(scene["ground_probe"], config.probe);
    if (scene.contains("gravity"))      parse_gravity(scene["gravity"], config.field);
}

// ---------------------------------------------------------------------------
// Entity spawning
// ---------------------------------------------------------------------------

static void spawn_entity(ecs::World& world, const json& e) {
    auto ent = world.create();

    // 1. LocalTransform + WorldTransform (must precede physics hooks)
    if (e.contains("transform")) {
        const auto& t = e["transform"];
        ecs::Vec3 pos = t.contains("position") ? parse_vec3(t["position"]) : ecs::Vec3{0,0,0};
        ecs::Quat rot = t.contains("rotation") ? parse_quat(t["rotation"]) : ecs::Quat{0,0,0,1};
        ecs::Vec3 scl = t.contains("scale")    ? parse_vec3(t["scale"])    : ecs::Vec3{1,1,1};
        world.add(ent, ecs::LocalTransform{pos, rot, scl});
        world.add(ent, ecs::WorldTransform{});
    }

    // 2. Colliders (must precede RigidBodyConfig so PhysicsSystem can read them)
    if (e.contains("box_collider")) {
        world.add(ent, BoxCollider{parse_vec3(e["box_collider"]["half_extents"])});
    }
    if (e.contains("sphere_collider")) {
        world.add(ent, SphereCollider{e["sphere_collider"]["radius"].get<float>()});
    }

    // 3. Visual representation
    if (e.contains("mesh")) {
        const auto& m = e["mesh"];
        MeshRenderer mesh;
        mesh.shape        = parse_shape(m.value("shape", std::string("Box")));
        mesh.color        = m.contains("color")        ? parse_color4(m["color"])      : Colors::White;
        mesh.scale_offset = m.contains("scale_offset") ? parse_vec3(m["scale_offset"]) : ecs::Vec3{1,1,1};
        mesh.visible      = m.value("visible", true);
        world.add(ent, std::move(mesh));
    }

    // 4. Gravity volume
    if (e.contains("gravity_zone")) {
        const auto& gz = e["gravity_zone"];
        GravityZoneConfig cfg;
        cfg.shape    = parse_zone_shape(gz.value("shape", std::string("Box")));
        cfg.mode     = parse_zone_mode(gz.value("mode", std::string("Directional")));
        if (gz.contains("half_extents")) cfg.half_extents = parse_vec3(gz["half_extents"]);
        if (gz.contains("direction"))    cfg.direction    = parse_vec3(gz["direction"]);
        cfg.radius   = gz.value("radius",   5.0f);
        cfg.priority = gz.value("priority", 0);
        cfg.strength = gz.value("strength", 9.81f);
        world.add(ent, std::move(cfg));
    }

    // 5. Physics / character (triggers on_add lifecycle hooks - added last so
    //    sibling components are already present when the hook fires)
    if (e.contains("rigid_body")) {
        const auto& rb = e["rigid_body"];
        RigidBodyConfig cfg;
        cfg.type        = parse_body_type(rb.value("type", std::string("Dynamic")));
        cfg.mass        = rb.value("mass",        1.0f);
        cfg.friction    = rb.value("friction",    0.5f);
        cfg.restitution = rb.value("restitution", 0.0f);
        cfg.sensor      = rb.value("sensor",      false);
        cfg.phase       = rb.value("phase",       false);
        world.add(ent, std::move(cfg));
    }

    // 6. Tags before the character so its hooks can see PlayerTag
    if (e.contains("tags")) {
        for (const auto& tag : e["tags"]) {
            const std::string t = tag.get<std::string>();
            if (t == "World")  world.add(ent, WorldTag{});
            if (t == "Player") {
                world.add(ent, PlayerTag{});
                world.add(ent, PlayerInput{});
            }
        }
    }

    if (e.contains("character")) {
        const auto& ch = e["character"];
        CharacterControllerConfig cfg;
        cfg.height          = ch.value("height",          1.8f);
        cfg.radius          = ch.value("radius",          0.4f);
        cfg.mass            = ch.value("mass",            70.0f);
        cfg.max_slope_angle = ch.value("max_slope_angle", 55.0f);
        cfg.align_speed     = ch.value("align_speed",     10.0f);
        cfg.turn_speed      = ch.value("turn_speed",      10.0f);
        cfg.stick_to_floor  = ch.value("stick_to_floor",  0.5f);
        cfg.step_height     = ch.value("step_height",     0.4f);
        world.add(ent, std::move(cfg));
    }
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

bool SceneLoader::load_config_from_string(const std::string& json_str, TuningConfig& config) {
    try {
        TuningConfig parsed = config;
        parse_tuning(json::parse(json_str), parsed);
        config = parsed;
        return true;
    } catch (const std::exception& ex) {
        std::cerr << "[Scene] Config parse failed: " << ex.what() << std::endl;
        return false;
    }
}

bool SceneLoader::load_from_string(ecs::World& world, const std::string& json_str) {
    try {
        json scene = json::parse(json_str);
        if (auto* tuning = world.try_resource<TuningConfig>()) {
            TuningConfig parsed = *tuning;
            parse_tuning(scene, parsed);
            *tuning = parsed;
        }
        for (const auto& entity_json : scene.at("entities")) {
            spawn_entity(world, entity_json);
        }
        return true;
    } catch (const std::exception& ex) {
        std::cerr << "[Scene] Load failed: " << ex.what() << std::endl;
        return false;
    }
}

bool SceneLoader::load(ecs::World& world, const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[Scene] Cannot open " << path << std::endl;
        return false;
    }
    const std::string content(std::istreambuf_iterator<char>(file),
                              std::istreambuf_iterator<char>{});
    return load_from_string(world, content);
}

void SceneLoader::unload(ecs::World& world) {
    std::vector<ecs::Entity> to_destroy;
    world.each<WorldTag>([&](ecs::Entity e, WorldTag&) { to_destroy.push_back(e); });
    for (auto e : to_destroy) world.destroy(e);
    world.deferred().flush(world);
}
