#include "viewcache/eviction_engine.hpp"
#include "viewcache/access_tracker.hpp"
#include "viewcache/cache_zone.hpp"
#include "viewcache/logging.hpp"
#include "viewcache/memory_estimator.hpp"
#include "viewcache/priority.hpp"

#include <algorithm>
#include <unordered_set>
#include <utility>

namespace viewcache {

namespace {

bool recently_accessed(const AccessTimestamps& access, const std::string& id,
                       int64_t now_ms, int64_t window_ms) {
    auto it = access.find(id);
    if (it == access.end()) return false;
    return now_ms - it->second <= window_ms;
}

CacheStats make_stats(const CleanupResult& result, int64_t initial, double per_record_kb) {
    CacheStats stats;
    stats.initial_count = initial;
    stats.kept_count = static_cast<int64_t>(result.keep.size());
    stats.evicted_count = static_cast<int64_t>(result.evict.size());
    stats.memory_freed_mb = estimate_memory_usage(stats.evicted_count, per_record_kb);
    return stats;
}

} // namespace

CleanupResult cleanup(const RecordTable& records,
                      const AccessTimestamps& access_timestamps,
                      const std::optional<Viewport>& viewport,
                      const TrackedSpatialKeys& tracked_keys,
                      const CacheConfig& config,
                      int64_t now_ms) {
    validate(config);

    // Table keys, not GeoRecord::id, are the identities handed back.
    std::vector<RankCandidate> candidates;
    candidates.reserve(records.size());
    for (const auto& [id, record] : records) {
        candidates.push_back({id, &record});
    }
    std::sort(candidates.begin(), candidates.end(),
              [](const RankCandidate& a, const RankCandidate& b) { return a.id < b.id; });

    const auto initial = static_cast<int64_t>(records.size());
    CleanupResult result;

    if (!viewport || viewport->bounds.is_degenerate()) {
        result.keep.reserve(candidates.size());
        for (const auto& candidate : candidates) {
            result.keep.emplace_back(candidate.id);
        }
        result.stats = make_stats(result, initial, config.per_record_kb);
        VIEWCACHE_LOG_DEBUG("cleanup kept everything, no usable viewport",
                            {int_field("records", initial)});
        return result;
    }

    const BoundingBox zone = compute_cache_zone(*viewport, config.expansion_factor);

    std::vector<RankCandidate> eligible;
    eligible.reserve(candidates.size());

    int64_t kept_by_area = 0;
    int64_t kept_by_recency = 0;
    for (const auto& candidate : candidates) {
        std::string id(candidate.id);
        bool spatial = config.use_spatial_key_filtering
                           ? tracked_keys.matches(candidate.record->spatial_keys)
                           : in_cache_zone(zone, candidate.record->position);
        if (spatial) {
            kept_by_area++;
            eligible.push_back(candidate);
        } else if (recently_accessed(access_timestamps, id, now_ms, config.recency_window_ms)) {
            kept_by_recency++;
            eligible.push_back(candidate);
        } else {
            result.evict.push_back(std::move(id));
        }
    }

    if (static_cast<int64_t>(eligible.size()) > config.hard_capacity) {
        VIEWCACHE_LOG_WARN("force cleanup triggered",
                           {int_field("eligible", static_cast<int64_t>(eligible.size())),
                            int_field("hard_capacity", config.hard_capacity),
                            int_field("soft_capacity", config.soft_capacity)});

        RetentionScorer scorer(config.weights);
        result.keep = rank_top(eligible, access_timestamps, scorer,
                               static_cast<size_t>(config.soft_capacity), now_ms);

        std::unordered_set<std::string> kept(result.keep.begin(), result.keep.end());
        for (const auto& candidate : eligible) {
            std::string id(candidate.id);
            if (kept.count(id) == 0) {
                result.evict.push_back(std::move(id));
            }
        }
        std::sort(result.keep.begin(), result.keep.end());
        std::sort(result.evict.begin(), result.evict.end());
    } else {
        result.keep.reserve(eligible.size());
        for (const auto& candidate : eligible) {
            result.keep.emplace_back(candidate.id);
        }
    }

    result.stats = make_stats(result, initial, config.per_record_kb);

    VIEWCACHE_LOG_DEBUG("cleanup completed",
                        {int_field("initial", result.stats.initial_count),
                         int_field("kept", result.stats.kept_count),
                         int_field("evicted", result.stats.evicted_count),
                         int_field("kept_by_area", kept_by_area),
                         int_field("kept_by_recency", kept_by_recency),
                         double_field("memory_freed_mb", result.stats.memory_freed_mb)});
    return result;
}

CleanupResult cleanup(const RecordTable& records,
                      const AccessTimestamps& access_timestamps,
                      const std::optional<Viewport>& viewport,
                      const TrackedSpatialKeys& tracked_keys,
                      const CacheConfig& config) {
    return cleanup(records, access_timestamps, viewport, tracked_keys, config, current_time_ms());
}

} // namespace viewcache
