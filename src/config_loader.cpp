#include "config_loader.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <fstream>
#include <iterator>
#include <limits>
#include <string>

using json = nlohmann::json;

namespace cubesim {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static Vec2 parse_vec2(const json& j) {
    return {j.at(0).get<float>(), j.at(1).get<float>()};
}

static void apply_world(const json& w, SimConfig& cfg) {
    const float margin = w.value("margin", cfg.bounds.margin);
    if (w.contains("width") || w.contains("height")) {
        const float width  = w.value("width",  cfg.bounds.max.x - cfg.bounds.min.x);
        const float height = w.value("height", cfg.bounds.max.y - cfg.bounds.min.y);
        cfg.bounds = WorldBounds::from_window_size(width, height, margin);
    }
    // Explicit corners win over width/height.
    if (w.contains("min")) cfg.bounds.min = parse_vec2(w["min"]);
    if (w.contains("max")) cfg.bounds.max = parse_vec2(w["max"]);
    cfg.bounds.margin = margin;
}

static void apply_body(const json& b, SimConfig& cfg) {
    cfg.extent   = b.value("extent",   cfg.extent);
    cfg.friction = b.value("friction", cfg.friction);
    if (b.contains("start")) cfg.start = parse_vec2(b["start"]);
}

static void apply_input(const json& i, SimConfig& cfg) {
    cfg.input_force      = i.value("force",            cfg.input_force);
    cfg.boost_multiplier = i.value("boost_multiplier", cfg.boost_multiplier);
}

static void apply_simulation(const json& s, SimConfig& cfg) {
    cfg.fixed_dt            = s.value("fixed_dt",            cfg.fixed_dt);
    cfg.restitution         = s.value("restitution",         cfg.restitution);
    if (s.contains("max_steps_per_frame")) {
        // Range-checked as 64-bit so an oversized value cannot wrap into a
        // valid-looking int before validate() sees it.
        const json& v = s["max_steps_per_frame"];
        if (!v.is_number_integer()) {
            throw ConfigError(ConfigError::Kind::InvalidParameter,
                              "max_steps_per_frame must be an integer");
        }
        const std::int64_t n = v.get<std::int64_t>();
        if (n < 0 || n > std::numeric_limits<int>::max()) {
            throw ConfigError(ConfigError::Kind::InvalidParameter,
                              "max_steps_per_frame out of range: " + v.dump());
        }
        cfg.max_steps_per_frame = static_cast<int>(n);
    }
}

static bool fail(std::string* error, const std::string& msg) {
    if (error) *error = msg;
    return false;
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

bool ConfigLoader::load_from_string(const std::string& json_str, SimConfig& out,
                                    std::string* error) {
    SimConfig cfg = out;
    try {
        json root = json::parse(json_str);
        if (!root.is_object()) return fail(error, "config root must be a JSON object");

        if (root.contains("world"))      apply_world(root["world"], cfg);
        if (root.contains("body"))       apply_body(root["body"], cfg);
        if (root.contains("input"))      apply_input(root["input"], cfg);
        if (root.contains("simulation")) apply_simulation(root["simulation"], cfg);

        cfg.validate();
    } catch (const ConfigError& e) {
        return fail(error, std::string(to_string(e.kind())) + ": " + e.what());
    } catch (const json::exception& e) {
        return fail(error, e.what());
    }

    out = cfg;
    return true;
}

bool ConfigLoader::load(const std::string& path, SimConfig& out, std::string* error) {
    std::ifstream file(path);
    if (!file.is_open()) return fail(error, "cannot open config file '" + path + "'");
    const std::string content(std::istreambuf_iterator<char>(file),
                              std::istreambuf_iterator<char>{});
    return load_from_string(content, out, error);
}

} // namespace cubesim
