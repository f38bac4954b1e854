/**
 * @file config.cpp
 * @brief Validation and loading of the environment configuration.
 */

#include "config.hpp"
#include "logging.hpp"
#include <cmath>
#include <functional>
#include <limits>

#include <yaml-cpp/yaml.h>

namespace auv_sim {

namespace {

void require_set(double value, const char* key) {
    if (std::isnan(value)) {
        throw ConfigError(key, "missing");
    }
    if (!std::isfinite(value)) {
        throw ConfigError(key, "must be finite");
    }
}

void require_positive(double value, const char* key) {
    require_set(value, key);
    if (value <= 0) {
        throw ConfigError(key, "must be positive");
    }
}

double require_double(const YAML::Node& root, const std::string& key) {
    const YAML::Node value = root[key];
    if (!value) {
        throw ConfigError(key, "missing");
    }
    if (!value.IsScalar()) {
        throw ConfigError(key, "expected a number");
    }
    try {
        return value.as<double>();
    } catch (const YAML::BadConversion&) {
        throw ConfigError(key, "expected a number, got '" + value.Scalar() + "'");
    }
}

template <typename T>
void optional_value(const YAML::Node& root, const std::string& key, T& out) {
    const YAML::Node value = root[key];
    if (!value) {
        return;
    }
    try {
        out = value.as<T>();
    } catch (const YAML::BadConversion&) {
        throw ConfigError(key, "malformed value");
    }
}

int to_count(double value, const std::string& key) {
    if (!std::isfinite(value) || value != std::floor(value)) {
        throw ConfigError(key, "expected an integer");
    }
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
        throw ConfigError(key, "out of range");
    }
    return static_cast<int>(value);
}

uint32_t to_seed(double value) {
    if (!std::isfinite(value) || value != std::floor(value)) {
        throw ConfigError("seed", "expected an integer");
    }
    if (value < 0 || value > std::numeric_limits<uint32_t>::max()) {
        throw ConfigError("seed", "must be in [0, 4294967295]");
    }
    return static_cast<uint32_t>(value);
}

}  // anonymous namespace

void AUVEnvConfig::validate() const {
    require_set(reward_ds, "reward_ds");
    require_set(reward_closeness, "reward_closeness");
    require_set(reward_surge_error, "reward_surge_error");
    require_set(reward_cross_track_error, "reward_cross_track_error");
    require_set(reward_collision, "reward_collision");

    if (nobstacles < 0) {
        throw ConfigError("nobstacles", "missing or negative");
    }
    require_positive(los_dist, "los_dist");
    require_positive(obst_range, "obst_range");
    require_positive(t_step, "t_step");
    require_set(cruise_speed, "cruise_speed");
    if (cruise_speed < 0) {
        throw ConfigError("cruise_speed", "must be non-negative");
    }

    if (nwaypoints < 0) {
        throw ConfigError("nwaypoints", "must be non-negative");
    }
    require_positive(path_length, "path_length");
    if (max_generation_attempts < 1) {
        throw ConfigError("max_generation_attempts", "must be at least 1");
    }
}

AUVEnvConfig AUVEnvConfig::from_yaml_file(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw ConfigError(path, std::string("cannot load YAML: ") + e.what());
    }
    logger()->debug("Loading environment config from {}", path);
    return from_yaml(root);
}

AUVEnvConfig AUVEnvConfig::from_yaml(const YAML::Node& root) {
    if (!root || !root.IsMap()) {
        throw ConfigError("<root>", "expected a YAML map");
    }

    AUVEnvConfig config;
    config.reward_ds = require_double(root, "reward_ds");
    config.reward_closeness = require_double(root, "reward_closeness");
    config.reward_surge_error = require_double(root, "reward_surge_error");
    config.reward_cross_track_error = require_double(root, "reward_cross_track_error");
    config.reward_collision = require_double(root, "reward_collision");
    config.nobstacles = to_count(require_double(root, "nobstacles"), "nobstacles");
    config.los_dist = require_double(root, "los_dist");
    config.obst_range = require_double(root, "obst_range");
    config.t_step = require_double(root, "t_step");
    config.cruise_speed = require_double(root, "cruise_speed");

    optional_value(root, "terminate_on_collision", config.terminate_on_collision);
    optional_value(root, "nwaypoints", config.nwaypoints);
    optional_value(root, "path_length", config.path_length);
    optional_value(root, "seed", config.seed);
    optional_value(root, "max_generation_attempts", config.max_generation_attempts);

    config.validate();
    return config;
}

AUVEnvConfig AUVEnvConfig::from_map(const std::map<std::string, double>& values) {
    AUVEnvConfig config;

    const std::map<std::string, std::function<void(double)>> setters = {
        {"reward_ds", [&](double v) { config.reward_ds = v; }},
        {"reward_closeness", [&](double v) { config.reward_closeness = v; }},
        {"reward_surge_error", [&](double v) { config.reward_surge_error = v; }},
        {"reward_cross_track_error", [&](double v) { config.reward_cross_track_error = v; }},
        {"reward_collision", [&](double v) { config.reward_collision = v; }},
        {"nobstacles", [&](double v) { config.nobstacles = to_count(v, "nobstacles"); }},
        {"los_dist", [&](double v) { config.los_dist = v; }},
        {"obst_range", [&](double v) { config.obst_range = v; }},
        {"t_step", [&](double v) { config.t_step = v; }},
        {"cruise_speed", [&](double v) { config.cruise_speed = v; }},
        {"terminate_on_collision", [&](double v) { config.terminate_on_collision = v != 0.0; }},
        {"nwaypoints", [&](double v) { config.nwaypoints = to_count(v, "nwaypoints"); }},
        {"path_length", [&](double v) { config.path_length = v; }},
        {"seed", [&](double v) { config.seed = to_seed(v); }},
        {"max_generation_attempts", [&](double v) {
            config.max_generation_attempts = to_count(v, "max_generation_attempts");
        }},
    };

    for (const auto& [key, value] : values) {
        auto it = setters.find(key);
        if (it == setters.end()) {
            throw ConfigError(key, "unknown option");
        }
        it->second(value);
    }

    config.validate();
    return config;
}

}  // namespace auv_sim
