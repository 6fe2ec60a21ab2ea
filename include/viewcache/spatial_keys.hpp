#pragma once

#include "viewcache/geo_record.hpp"

#include <array>
#include <string>
#include <unordered_set>
#include <vector>

namespace viewcache {

// Spatial keys covering the host's current view, one set per resolution.
class TrackedSpatialKeys {
public:
    TrackedSpatialKeys() = default;
    explicit TrackedSpatialKeys(const std::array<std::vector<std::string>, SPATIAL_RESOLUTIONS>& keys);

    void add(size_t resolution, const std::string& key);
    void clear();

    bool empty() const;
    size_t size(size_t resolution) const { return keys_.at(resolution).size(); }
    const std::unordered_set<std::string>& at(size_t resolution) const { return keys_.at(resolution); }

    // True if any resolution of the record's keys is tracked. Empty keys never match.
    bool matches(const SpatialKeys& record_keys) const;

private:
    std::array<std::unordered_set<std::string>, SPATIAL_RESOLUTIONS> keys_;
};

// Mean Jaccard similarity over the four resolutions.
double spatial_overlap(const TrackedSpatialKeys& a, const TrackedSpatialKeys& b);

} // namespace viewcache
