#pragma once

#include "viewcache/geo_record.hpp"

namespace viewcache {

// Padded retention box around the viewport: width and height scaled by
// expansion_factor, centered on the center of the viewport bounds. Plain
// degrees, no projection correction. A degenerate viewport yields a
// zero-area zone.
BoundingBox compute_cache_zone(const Viewport& viewport, double expansion_factor);
BoundingBox expand_bounds(const BoundingBox& bounds, double factor);

bool in_cache_zone(const BoundingBox& zone, const Position& position);

} // namespace viewcache
