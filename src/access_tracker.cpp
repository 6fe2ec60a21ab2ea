#include "viewcache/access_tracker.hpp"

#include <chrono>

namespace viewcache {

int64_t current_time_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

void AccessTracker::touch(const std::string& id, int64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    timestamps_[id] = now_ms;
}

void AccessTracker::touch_many(const std::vector<std::string>& ids, int64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& id : ids) {
        timestamps_[id] = now_ms;
    }
}

void AccessTracker::forget(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    timestamps_.erase(id);
}

void AccessTracker::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    timestamps_.clear();
}

std::optional<int64_t> AccessTracker::last_access(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = timestamps_.find(id);
    if (it == timestamps_.end()) {
        return std::nullopt;
    }
    return it->second;
}

AccessTimestamps AccessTracker::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timestamps_;
}

size_t AccessTracker::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timestamps_.size();
}

} // namespace viewcache
