#include "viewcache/cache_zone.hpp"

namespace viewcache {

BoundingBox expand_bounds(const BoundingBox& bounds, double factor) {
    if (bounds.is_degenerate()) {
        double lon = bounds.center_lon();
        double lat = bounds.center_lat();
        return {lon, lat, lon, lat};
    }

    double center_lon = bounds.center_lon();
    double center_lat = bounds.center_lat();
    double half_width = bounds.width() * factor / 2.0;
    double half_height = bounds.height() * factor / 2.0;

    return {
        center_lon - half_width,
        center_lat - half_height,
        center_lon + half_width,
        center_lat + half_height,
    };
}

BoundingBox compute_cache_zone(const Viewport& viewport, double expansion_factor) {
    return expand_bounds(viewport.bounds, expansion_factor);
}

bool in_cache_zone(const BoundingBox& zone, const Position& position) {
    return zone.contains(position.lon(), position.lat());
}

} // namespace viewcache
