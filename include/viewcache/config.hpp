#pragma once

#include <cstdint>
#include <string>

namespace viewcache {

// Retention scorer weights. Only their monotonic direction is relied upon.
struct PriorityWeights {
    double generation = 0.25;
    double reference_count = 0.20;
    double content = 0.15;
    double recency = 0.15;
    double freshness = 0.25;

    double exploration_bonus = 0.4;
    double exploration_bonus_days = 7.0;
    double freshness_half_life_days = 30.0;

    int64_t generation_cap = 8;
    int64_t reference_count_cap = 8;
};

struct LoggingConfig {
    std::string level = "info";
    std::string pattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
};

struct CacheConfig {
    // Cache Zone = viewport width/height * expansion_factor, same center.
    double expansion_factor = 1.75;
    int64_t recency_window_ms = 60000;
    int64_t hard_capacity = 4000;
    int64_t soft_capacity = 3000;
    double per_record_kb = 1.8;

    // Match spatial keys instead of the padded bounds for eligibility.
    bool use_spatial_key_filtering = false;
    double spatial_overlap_threshold = 0.3;

    // Host-side scheduling and display.
    int64_t cleanup_debounce_ms = 1000;
    int64_t max_visible_markers = 100;

    double memory_warning_mb = 8.0;
    double memory_critical_mb = 10.0;

    PriorityWeights weights;
    LoggingConfig logging;
};

// Throws ConfigError when a precondition does not hold.
void validate(const CacheConfig& config);

// Reads a YAML file with optional `cache`, `priority`, `memory` and `logging`
// sections; missing keys keep their defaults, unknown keys are rejected.
CacheConfig load_config(const std::string& path);
CacheConfig load_config_from_string(const std::string& yaml);

} // namespace viewcache
