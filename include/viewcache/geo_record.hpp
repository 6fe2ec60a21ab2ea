#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

namespace viewcache {

constexpr double COORD_SCALE = 1e6;
constexpr double ELEVATION_SCALE = 1e4;

// Fixed-point position: degrees * 10^6, elevation metres * 10^4.
struct Position {
    int64_t lat_e6 = 0;
    int64_t lon_e6 = 0;
    int64_t elevation_e4 = 0;

    double lat() const { return static_cast<double>(lat_e6) / COORD_SCALE; }
    double lon() const { return static_cast<double>(lon_e6) / COORD_SCALE; }
    double elevation() const { return static_cast<double>(elevation_e4) / ELEVATION_SCALE; }

    static Position from_degrees(double lat, double lon, double elevation = 0.0);
};

// Spatial cell identifiers, coarse to fine (r6, r8, r10, r12).
constexpr size_t SPATIAL_RESOLUTIONS = 4;
using SpatialKeys = std::array<std::string, SPATIAL_RESOLUTIONS>;

struct GeoRecord {
    std::string id;
    Position position;
    SpatialKeys spatial_keys;
    int64_t generation = 0;
    int64_t reference_count = 0;
    std::optional<std::string> content;
    int64_t created_at = 0; // seconds, 0 when unknown

    bool has_content() const { return content.has_value() && !content->empty(); }
};

struct BoundingBox {
    double west = 0.0;
    double south = 0.0;
    double east = 0.0;
    double north = 0.0;

    double width() const { return east - west; }
    double height() const { return north - south; }
    double center_lon() const { return (west + east) / 2.0; }
    double center_lat() const { return (south + north) / 2.0; }

    bool is_degenerate() const { return !(width() > 0.0) || !(height() > 0.0); }

    // Edges are inclusive.
    bool contains(double lon, double lat) const {
        return lon >= west && lon <= east && lat >= south && lat <= north;
    }
};

struct Viewport {
    double center_lon = 0.0;
    double center_lat = 0.0;
    double zoom = 0.0;
    BoundingBox bounds;
};

using RecordTable = std::unordered_map<std::string, GeoRecord>;

// Last-touch wall clock per record id, in milliseconds.
using AccessTimestamps = std::unordered_map<std::string, int64_t>;

} // namespace viewcache
