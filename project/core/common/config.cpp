// core/common/config.cpp
#include "config.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "log.hpp"

using nlohmann::json;

namespace {
struct ConfigError : std::runtime_error {
    using std::runtime_error::runtime_error;
};
}

AppCfg default_app_config()
{
    return AppCfg{};
}

// Absent keys keep the value already in `out`.
template<typename T>
static void read_key(const json& j, const char* key, T& out)
{
    auto it = j.find(key);
    if (it != j.end()) {
        out = it->get<T>();
    }
}

static void read_object(const json& j, const char* key, const json*& out)
{
    out = nullptr;
    auto it = j.find(key);
    if (it == j.end()) return;
    if (!it->is_object()) {
        throw ConfigError(std::string("'") + key + "' must be an object");
    }
    out = &*it;
}

static void apply_json(const json& root, AppCfg& cfg)
{
    if (!root.is_object()) {
        throw ConfigError("config root must be an object");
    }

    read_key(root, "dt", cfg.dt);

    const json* node = nullptr;
    read_object(root, "cloth", node);
    if (node) {
        read_key(*node, "rows",         cfg.cloth.rows);
        read_key(*node, "cols",         cfg.cloth.cols);
        read_key(*node, "spacing",      cfg.cloth.spacing);
        read_key(*node, "origin_x",     cfg.cloth.origin_x);
        read_key(*node, "origin_y",     cfg.cloth.origin_y);
        read_key(*node, "pin_top_edge", cfg.cloth.pin_top_edge);
    }

    read_object(root, "physics", node);
    if (node) {
        read_key(*node, "gravity",    cfg.physics.gravity);
        read_key(*node, "damping",    cfg.physics.damping);
        read_key(*node, "iterations", cfg.physics.iterations);
    }

    read_object(root, "interaction", node);
    if (node) {
        read_key(*node, "pick_radius", cfg.interaction.pick_radius);
    }

    read_object(root, "run", node);
    if (node) {
        read_key(*node, "ticks",        cfg.run.ticks);
        read_key(*node, "ascii_frame",  cfg.run.ascii_frame);
        read_key(*node, "ascii_width",  cfg.run.ascii_width);
        read_key(*node, "ascii_height", cfg.run.ascii_height);

        const json* drag = nullptr;
        read_object(*node, "drag", drag);
        if (drag) {
            cfg.run.drag.enabled = true;
            read_key(*drag, "enabled",        cfg.run.drag.enabled);
            read_key(*drag, "from_x",         cfg.run.drag.from_x);
            read_key(*drag, "from_y",         cfg.run.drag.from_y);
            read_key(*drag, "to_x",           cfg.run.drag.to_x);
            read_key(*drag, "to_y",           cfg.run.drag.to_y);
            read_key(*drag, "start_tick",     cfg.run.drag.start_tick);
            read_key(*drag, "duration_ticks", cfg.run.drag.duration_ticks);
        }
    }
}

Result<AppCfg> parse_app_config(const std::string& json_text)
{
    AppCfg cfg = default_app_config();
    try {
        const json root = json::parse(json_text);
        apply_json(root, cfg);
    } catch (const json::exception& e) {
        return Result<AppCfg>::failure(std::string("invalid config: ") + e.what());
    } catch (const ConfigError& e) {
        return Result<AppCfg>::failure(std::string("invalid config: ") + e.what());
    }
    return validate_app_config(cfg);
}

Result<AppCfg> load_app_config(const std::string& path)
{
    std::ifstream file(path);
    if (!file) {
        return Result<AppCfg>::failure("cannot open config file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto result = parse_app_config(buffer.str());
    if (result.ok) {
        logging::config()->info("loaded config from {}", path);
    }
    return result;
}

Result<AppCfg> validate_app_config(const AppCfg& cfg)
{
    if (cfg.cloth.rows < 1 || cfg.cloth.cols < 1) {
        return Result<AppCfg>::failure("cloth.rows and cloth.cols must be at least 1");
    }
    if (!(cfg.cloth.spacing > 0.0)) {
        return Result<AppCfg>::failure("cloth.spacing must be positive");
    }
    if (!(cfg.physics.damping > 0.0 && cfg.physics.damping <= 1.0)) {
        return Result<AppCfg>::failure("physics.damping must be in (0, 1]");
    }
    if (cfg.physics.iterations < 0) {
        return Result<AppCfg>::failure("physics.iterations must not be negative");
    }
    if (!(cfg.dt > 0.0)) {
        return Result<AppCfg>::failure("dt must be positive");
    }
    if (cfg.interaction.pick_radius < 0.0) {
        return Result<AppCfg>::failure("interaction.pick_radius must not be negative");
    }
    if (cfg.run.ticks < 0) {
        return Result<AppCfg>::failure("run.ticks must not be negative");
    }
    if (cfg.run.ascii_width < 1 || cfg.run.ascii_height < 1) {
        return Result<AppCfg>::failure("run.ascii_width and run.ascii_height must be at least 1");
    }
    if (cfg.run.drag.enabled) {
        const DragCfg& d = cfg.run.drag;
        if (d.start_tick < 0 || d.start_tick > cfg.run.ticks) {
            return Result<AppCfg>::failure("run.drag.start_tick must be in [0, run.ticks]");
        }
        if (d.duration_ticks < 1 || d.duration_ticks > cfg.run.ticks) {
            return Result<AppCfg>::failure("run.drag.duration_ticks must be in [1, run.ticks]");
        }
    }
    return Result<AppCfg>::success(cfg);
}
