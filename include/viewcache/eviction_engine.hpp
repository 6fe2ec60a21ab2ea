#pragma once

#include "viewcache/config.hpp"
#include "viewcache/geo_record.hpp"
#include "viewcache/spatial_keys.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace viewcache {

struct CacheStats {
    int64_t initial_count = 0;
    int64_t kept_count = 0;
    int64_t evicted_count = 0;
    double memory_freed_mb = 0.0;
};

struct CleanupResult {
    std::vector<std::string> keep;
    std::vector<std::string> evict;
    CacheStats stats;
};

// Partitions the record table into keep and evict. Pure: reads its inputs,
// holds no state, never mutates the table. Throws ConfigError on invalid
// capacities.
//
// A record is eligible when it lies in the Cache Zone (or matches a tracked
// spatial key, if enabled) or was accessed within recency_window_ms.
// Ineligible records are always evicted. If more than hard_capacity records
// are eligible, only the top soft_capacity by retention score are kept.
// Without a usable viewport everything is kept.
CleanupResult cleanup(const RecordTable& records,
                      const AccessTimestamps& access_timestamps,
                      const std::optional<Viewport>& viewport,
                      const TrackedSpatialKeys& tracked_keys,
                      const CacheConfig& config,
                      int64_t now_ms);

CleanupResult cleanup(const RecordTable& records,
                      const AccessTimestamps& access_timestamps,
                      const std::optional<Viewport>& viewport,
                      const TrackedSpatialKeys& tracked_keys,
                      const CacheConfig& config);

} // namespace viewcache
