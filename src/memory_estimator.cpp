#include "viewcache/memory_estimator.hpp"
#include "viewcache/config.hpp"

#include <cmath>

namespace viewcache {

double estimate_memory_usage(int64_t count, double per_record_kb) {
    if (count <= 0) return 0.0;
    double mb = static_cast<double>(count) * per_record_kb / 1024.0;
    return std::round(mb * 100.0) / 100.0;
}

bool is_memory_warning(int64_t count, const CacheConfig& config) {
    return estimate_memory_usage(count, config.per_record_kb) >= config.memory_warning_mb;
}

bool is_memory_critical(int64_t count, const CacheConfig& config) {
    return estimate_memory_usage(count, config.per_record_kb) >= config.memory_critical_mb;
}

} // namespace viewcache
