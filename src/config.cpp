#include "viewcache/config.hpp"
#include "viewcache/errors.hpp"

#include <yaml-cpp/yaml.h>

#include <functional>
#include <map>
#include <string>
#include <utility>

namespace viewcache {

namespace {

using FieldSetter = std::function<void(const YAML::Node&)>;

template <typename T>
FieldSetter field_setter(T& field) {
    return [&field](const YAML::Node& node) { field = node.as<T>(); };
}

void apply_section(const YAML::Node& root, const std::string& section,
                   const std::map<std::string, FieldSetter>& fields) {
    const YAML::Node node = root[section];
    if (!node) return;
    if (!node.IsMap()) {
        throw ConfigError("config section '" + section + "' must be a map");
    }

    for (const auto& entry : node) {
        const auto key = entry.first.as<std::string>();
        auto it = fields.find(key);
        if (it == fields.end()) {
            throw ConfigError("unknown config key '" + section + "." + key + "'");
        }
        try {
            it->second(entry.second);
        } catch (const YAML::Exception& e) {
            throw ConfigError("invalid value for '" + section + "." + key + "': " + e.what());
        }
    }
}

CacheConfig parse(const YAML::Node& root) {
    CacheConfig config;
    if (!root || root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        throw ConfigError("config root must be a map");
    }

    for (const auto& entry : root) {
        const auto section = entry.first.as<std::string>();
        if (section != "cache" && section != "priority" && section != "memory" && section != "logging") {
            throw ConfigError("unknown config section '" + section + "'");
        }
    }

    apply_section(root, "cache", {
        {"expansion_factor", field_setter(config.expansion_factor)},
        {"recency_window_ms", field_setter(config.recency_window_ms)},
        {"hard_capacity", field_setter(config.hard_capacity)},
        {"soft_capacity", field_setter(config.soft_capacity)},
        {"use_spatial_key_filtering", field_setter(config.use_spatial_key_filtering)},
        {"spatial_overlap_threshold", field_setter(config.spatial_overlap_threshold)},
        {"cleanup_debounce_ms", field_setter(config.cleanup_debounce_ms)},
        {"max_visible_markers", field_setter(config.max_visible_markers)},
    });

    auto& w = config.weights;
    apply_section(root, "priority", {
        {"generation", field_setter(w.generation)},
        {"reference_count", field_setter(w.reference_count)},
        {"content", field_setter(w.content)},
        {"recency", field_setter(w.recency)},
        {"freshness", field_setter(w.freshness)},
        {"exploration_bonus", field_setter(w.exploration_bonus)},
        {"exploration_bonus_days", field_setter(w.exploration_bonus_days)},
        {"freshness_half_life_days", field_setter(w.freshness_half_life_days)},
        {"generation_cap", field_setter(w.generation_cap)},
        {"reference_count_cap", field_setter(w.reference_count_cap)},
    });

    apply_section(root, "memory", {
        {"per_record_kb", field_setter(config.per_record_kb)},
        {"warning_mb", field_setter(config.memory_warning_mb)},
        {"critical_mb", field_setter(config.memory_critical_mb)},
    });

    apply_section(root, "logging", {
        {"level", field_setter(config.logging.level)},
        {"pattern", field_setter(config.logging.pattern)},
    });

    validate(config);
    return config;
}

} // namespace

void validate(const CacheConfig& config) {
    if (config.hard_capacity <= 0) {
        throw ConfigError("hard_capacity must be positive, got " + std::to_string(config.hard_capacity));
    }
    if (config.soft_capacity <= 0) {
        throw ConfigError("soft_capacity must be positive, got " + std::to_string(config.soft_capacity));
    }
    if (config.soft_capacity > config.hard_capacity) {
        throw ConfigError("soft_capacity (" + std::to_string(config.soft_capacity) +
                          ") exceeds hard_capacity (" + std::to_string(config.hard_capacity) + ")");
    }
    if (!(config.expansion_factor > 0.0)) {
        throw ConfigError("expansion_factor must be positive");
    }
    if (config.recency_window_ms < 0) {
        throw ConfigError("recency_window_ms must not be negative");
    }
    if (!(config.per_record_kb >= 0.0)) {
        throw ConfigError("per_record_kb must not be negative");
    }
    if (config.weights.generation_cap < 0 || config.weights.reference_count_cap < 0) {
        throw ConfigError("priority caps must not be negative");
    }

    const auto& w = config.weights;
    const std::pair<const char*, double> weights[] = {
        {"generation", w.generation},
        {"reference_count", w.reference_count},
        {"content", w.content},
        {"recency", w.recency},
        {"freshness", w.freshness},
        {"exploration_bonus", w.exploration_bonus},
        {"exploration_bonus_days", w.exploration_bonus_days},
    };
    for (const auto& [name, value] : weights) {
        if (!(value >= 0.0)) {
            throw ConfigError(std::string("priority.") + name + " must not be negative");
        }
    }
    if (!(w.freshness_half_life_days > 0.0)) {
        throw ConfigError("priority.freshness_half_life_days must be positive");
    }
}

CacheConfig load_config(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw ConfigError("failed to load config '" + path + "': " + e.what());
    }
    return parse(root);
}

CacheConfig load_config_from_string(const std::string& yaml) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml);
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("failed to parse config: ") + e.what());
    }
    return parse(root);
}

} // namespace viewcache
