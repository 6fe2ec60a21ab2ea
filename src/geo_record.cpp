#include "viewcache/geo_record.hpp"

#include <cmath>

namespace viewcache {

Position Position::from_degrees(double lat, double lon, double elevation) {
    Position p;
    p.lat_e6 = std::llround(lat * COORD_SCALE);
    p.lon_e6 = std::llround(lon * COORD_SCALE);
    p.elevation_e4 = std::llround(elevation * ELEVATION_SCALE);
    return p;
}

} // namespace viewcache
