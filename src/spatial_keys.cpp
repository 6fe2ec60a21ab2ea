#include "viewcache/spatial_keys.hpp"

namespace viewcache {

TrackedSpatialKeys::TrackedSpatialKeys(
    const std::array<std::vector<std::string>, SPATIAL_RESOLUTIONS>& keys) {
    for (size_t r = 0; r < SPATIAL_RESOLUTIONS; r++) {
        for (const auto& key : keys[r]) {
            add(r, key);
        }
    }
}

void TrackedSpatialKeys::add(size_t resolution, const std::string& key) {
    if (key.empty()) return;
    keys_.at(resolution).insert(key);
}

void TrackedSpatialKeys::clear() {
    for (auto& set : keys_) set.clear();
}

bool TrackedSpatialKeys::empty() const {
    for (const auto& set : keys_) {
        if (!set.empty()) return false;
    }
    return true;
}

bool TrackedSpatialKeys::matches(const SpatialKeys& record_keys) const {
    for (size_t r = 0; r < SPATIAL_RESOLUTIONS; r++) {
        const auto& key = record_keys[r];
        if (!key.empty() && keys_[r].count(key) > 0) {
            return true;
        }
    }
    return false;
}

namespace {

double jaccard(const std::unordered_set<std::string>& a, const std::unordered_set<std::string>& b) {
    const auto& smaller = a.size() <= b.size() ? a : b;
    const auto& larger = a.size() <= b.size() ? b : a;

    size_t intersection = 0;
    for (const auto& key : smaller) {
        if (larger.count(key) > 0) intersection++;
    }
    size_t union_size = a.size() + b.size() - intersection;
    return union_size > 0 ? static_cast<double>(intersection) / static_cast<double>(union_size) : 0.0;
}

} // namespace

double spatial_overlap(const TrackedSpatialKeys& a, const TrackedSpatialKeys& b) {
    double total = 0.0;
    for (size_t r = 0; r < SPATIAL_RESOLUTIONS; r++) {
        total += jaccard(a.at(r), b.at(r));
    }
    return total / static_cast<double>(SPATIAL_RESOLUTIONS);
}

} // namespace viewcache
