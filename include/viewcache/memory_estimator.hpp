#pragma once

#include <cstdint>

namespace viewcache {

struct CacheConfig;

constexpr double DEFAULT_PER_RECORD_KB = 1.8;

// count * per_record_kb / 1024, rounded to 2 decimals.
double estimate_memory_usage(int64_t count, double per_record_kb = DEFAULT_PER_RECORD_KB);

bool is_memory_warning(int64_t count, const CacheConfig& config);
bool is_memory_critical(int64_t count, const CacheConfig& config);

} // namespace viewcache
