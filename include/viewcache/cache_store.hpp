#pragma once

#include "viewcache/access_tracker.hpp"
#include "viewcache/config.hpp"
#include "viewcache/eviction_engine.hpp"
#include "viewcache/geo_record.hpp"
#include "viewcache/spatial_keys.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace viewcache {

struct CumulativeCacheStats {
    int64_t total_cached = 0;
    int64_t total_evicted = 0;
    int64_t last_cleanup_ms = 0;
    int64_t cleanup_count = 0;
    double memory_estimate_mb = 0.0;
};

// Authoritative record table for a map view. Runs the eviction engine on
// demand and applies its partition.
class CacheStore {
public:
    explicit CacheStore(CacheConfig config = {});

    // Upserts records and marks them accessed.
    void ingest(const std::vector<GeoRecord>& batch, int64_t now_ms);
    // Marks ids accessed; unknown ids are ignored.
    void touch(const std::vector<std::string>& ids, int64_t now_ms);

    // Returns true when the tracked keys moved enough to warrant a cleanup.
    bool update_viewport(const Viewport& viewport, const TrackedSpatialKeys& keys = {});
    void set_fetch_in_progress(bool in_progress);

    // nullopt when skipped: fetch in progress or within cleanup_debounce_ms.
    std::optional<CleanupResult> run_cleanup(int64_t now_ms);

    std::vector<std::string> visible_markers(int64_t now_ms) const;

    bool contains(const std::string& id) const;
    std::optional<GeoRecord> get(const std::string& id) const;
    std::optional<int64_t> last_access(const std::string& id) const;
    size_t size() const;
    CumulativeCacheStats cumulative_stats() const;
    const CacheConfig& config() const { return config_; }
    void clear();

private:
    CacheConfig config_;
    RecordTable records_;
    AccessTracker access_;
    std::optional<Viewport> viewport_;
    TrackedSpatialKeys tracked_keys_;
    bool fetch_in_progress_ = false;
    CumulativeCacheStats stats_;
    mutable std::mutex mutex_;
};

} // namespace viewcache
