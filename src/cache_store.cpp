#include "viewcache/cache_store.hpp"
#include "viewcache/logging.hpp"
#include "viewcache/memory_estimator.hpp"
#include "viewcache/priority.hpp"

#include <utility>

namespace viewcache {

CacheStore::CacheStore(CacheConfig config) : config_(std::move(config)) {
    validate(config_);
}

void CacheStore::ingest(const std::vector<GeoRecord>& batch, int64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& record : batch) {
        records_[record.id] = record;
        access_.touch(record.id, now_ms);
    }
    stats_.total_cached = static_cast<int64_t>(records_.size());
    stats_.memory_estimate_mb = estimate_memory_usage(stats_.total_cached, config_.per_record_kb);
}

void CacheStore::touch(const std::vector<std::string>& ids, int64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& id : ids) {
        if (records_.count(id) > 0) {
            access_.touch(id, now_ms);
        }
    }
}

bool CacheStore::update_viewport(const Viewport& viewport, const TrackedSpatialKeys& keys) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool first = !viewport_.has_value();
    viewport_ = viewport;

    // Without keys on either side, every viewport change counts.
    bool moved = first || keys.empty() || tracked_keys_.empty() ||
                 spatial_overlap(tracked_keys_, keys) < config_.spatial_overlap_threshold;
    tracked_keys_ = keys;
    return moved;
}

void CacheStore::set_fetch_in_progress(bool in_progress) {
    std::lock_guard<std::mutex> lock(mutex_);
    fetch_in_progress_ = in_progress;
}

std::optional<CleanupResult> CacheStore::run_cleanup(int64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (fetch_in_progress_) {
        VIEWCACHE_LOG_DEBUG("cleanup skipped, fetch in progress");
        return std::nullopt;
    }
    if (stats_.cleanup_count > 0 && now_ms - stats_.last_cleanup_ms < config_.cleanup_debounce_ms) {
        VIEWCACHE_LOG_DEBUG("cleanup skipped, too soon after last cleanup",
                            {int_field("since_last_ms", now_ms - stats_.last_cleanup_ms)});
        return std::nullopt;
    }

    CleanupResult result = cleanup(records_, access_.snapshot(), viewport_, tracked_keys_, config_, now_ms);

    for (const auto& id : result.evict) {
        records_.erase(id);
        access_.forget(id);
    }

    stats_.total_cached = result.stats.kept_count;
    stats_.total_evicted += result.stats.evicted_count;
    stats_.last_cleanup_ms = now_ms;
    stats_.cleanup_count++;
    stats_.memory_estimate_mb = estimate_memory_usage(result.stats.kept_count, config_.per_record_kb);

    VIEWCACHE_LOG_INFO("cleanup applied",
                       {string_field("method", config_.use_spatial_key_filtering ? "spatial-keys" : "bounds"),
                        int_field("kept", result.stats.kept_count),
                        int_field("evicted", result.stats.evicted_count),
                        int_field("total_evicted", stats_.total_evicted),
                        int_field("cleanup_count", stats_.cleanup_count),
                        double_field("memory_estimate_mb", stats_.memory_estimate_mb)});

    if (is_memory_critical(result.stats.kept_count, config_)) {
        VIEWCACHE_LOG_ERROR("cache memory usage is critical",
                            {double_field("memory_estimate_mb", stats_.memory_estimate_mb)});
    } else if (is_memory_warning(result.stats.kept_count, config_)) {
        VIEWCACHE_LOG_WARN("cache memory usage is approaching its limit",
                           {double_field("memory_estimate_mb", stats_.memory_estimate_mb)});
    }

    return result;
}

std::vector<std::string> CacheStore::visible_markers(int64_t now_ms) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<const GeoRecord*> visible;
    for (const auto& [id, record] : records_) {
        if (!viewport_ || viewport_->bounds.contains(record.position.lon(), record.position.lat())) {
            visible.push_back(&record);
        }
    }
    return limit_markers(visible, static_cast<size_t>(config_.max_visible_markers), now_ms);
}

bool CacheStore::contains(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.count(id) > 0;
}

std::optional<GeoRecord> CacheStore::get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<int64_t> CacheStore::last_access(const std::string& id) const {
    return access_.last_access(id);
}

size_t CacheStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

CumulativeCacheStats CacheStore::cumulative_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

void CacheStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.clear();
    access_.clear();
    tracked_keys_.clear();
    viewport_.reset();
    stats_ = {};
}

} // namespace viewcache
