#pragma once

#include "viewcache/geo_record.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace viewcache {

// Wall clock in milliseconds since the Unix epoch.
int64_t current_time_ms();

// Host-owned record of when each id was last rendered or touched. The
// eviction engine only ever sees a snapshot.
class AccessTracker {
public:
    void touch(const std::string& id, int64_t now_ms);
    void touch_many(const std::vector<std::string>& ids, int64_t now_ms);
    void forget(const std::string& id);
    void clear();

    std::optional<int64_t> last_access(const std::string& id) const;
    AccessTimestamps snapshot() const;
    size_t size() const;

private:
    AccessTimestamps timestamps_;
    mutable std::mutex mutex_;
};

} // namespace viewcache
