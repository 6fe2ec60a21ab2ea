#pragma once

#include "viewcache/access_tracker.hpp"
#include "viewcache/cache_store.hpp"
#include "viewcache/cache_zone.hpp"
#include "viewcache/config.hpp"
#include "viewcache/errors.hpp"
#include "viewcache/eviction_engine.hpp"
#include "viewcache/geo_record.hpp"
#include "viewcache/logging.hpp"
#include "viewcache/memory_estimator.hpp"
#include "viewcache/priority.hpp"
#include "viewcache/spatial_keys.hpp"

namespace viewcache {

constexpr const char* VERSION = "0.1.0";

} // namespace viewcache
