#pragma once

#include "slippymap/geometry.h"

#include <array>
#include <cstdint>
#include <string>

// Web-Mercator ("slippy map") projection and tile arithmetic.
// Ref.: https://wiki.openstreetmap.org/wiki/Slippy_Map
namespace slippymap {

// Map zoom. 19 = maximum zoom of the Mapnik layer.
using ZoomLevel = int;

constexpr ZoomLevel kMinZoom = 0;
constexpr ZoomLevel kMaxZoom = 19;

constexpr int kTileWidth = 256;
constexpr int kTileHeight = 256;

constexpr double kMinLongitude = -180.0;
constexpr double kMaxLongitude = 180.0;
constexpr double kMinLatitude = -85.1;
constexpr double kMaxLatitude = 85.1;

// https://wiki.openstreetmap.org/wiki/Zoom_levels
constexpr std::array<double, kMaxZoom + 1> kMetersPerPixelOnEquator = {
    156412, 78206, 39103, 19551, 9776, 4888, 2444, 1222, 610.984, 305.492,
    152.746, 76.373, 38.187, 19.093, 9.547, 4.773, 2.387, 1.193, 0.596, 0.298,
};

// Point on a map defined by longitude and latitude, in degrees.
// Latitude grows upwards while pixel Y grows downwards, so this is
// deliberately not a floating-point Point.
struct GeoPoint {
    double longitude = 0.0;
    double latitude = 0.0;

    GeoPoint() = default;
    // Throws std::out_of_range outside [-180,180] x [-85.1,85.1].
    GeoPoint(double longitude, double latitude);

    friend bool operator==(const GeoPoint&, const GeoPoint&) = default;
};

// Region defined by its north-west (top-left) and south-east (bottom-right) corners.
struct GeoRect {
    GeoPoint top_left;
    GeoPoint bottom_right;

    [[nodiscard]] bool contains(const GeoPoint& p) const;
};

struct Tile {
    ZoomLevel zoom = 0;
    uint32_t x = 0;
    uint32_t y = 0;

    friend bool operator==(const Tile&, const Tile&) = default;
};

// Parts of a tile URL: prefix + pattern + postfix. The pattern takes the
// {zoom}, {x} and {y} placeholders.
struct TileUrlParts {
    std::string prefix = "http://tile.openstreetmap.org/";
    std::string pattern = "{zoom}/{x}/{y}.png";
    std::string postfix;
};

struct ScaleBarParams {
    int width_px = 0;
    int width_m = 0;
    std::string text;
};

[[nodiscard]] constexpr bool zoom_valid(int zoom) { return zoom >= kMinZoom && zoom <= kMaxZoom; }

// Number of tiles per side on `zoom` level (2^zoom).
[[nodiscard]] uint32_t tile_count(ZoomLevel zoom);
[[nodiscard]] bool tile_valid(const Tile& tile);
// "<zoom> * [<x> : <y>]"
[[nodiscard]] std::string tile_to_string(const Tile& tile);
[[nodiscard]] std::string tile_to_url(const TileUrlParts& parts, const Tile& tile);
// Top-left pixel of the tile on the map surface.
[[nodiscard]] Point tile_origin(const Tile& tile);

[[nodiscard]] constexpr int to_tile_width_lesser(int v) { return (v / kTileWidth) * kTileWidth; }
[[nodiscard]] constexpr int to_tile_height_lesser(int v) { return (v / kTileHeight) * kTileHeight; }
[[nodiscard]] constexpr int to_tile_width_greater(int v) {
    return to_tile_width_lesser(v) + (v % kTileWidth > 0 ? kTileWidth : 0);
}
[[nodiscard]] constexpr int to_tile_height_greater(int v) {
    return to_tile_height_lesser(v) + (v % kTileHeight > 0 ? kTileHeight : 0);
}

// Floors the top-left and ceils the bottom-right to tile boundaries.
// Coordinates are map pixels and therefore non-negative.
[[nodiscard]] Rect to_tile_boundary(const Rect& r);

[[nodiscard]] int map_width(ZoomLevel zoom);
[[nodiscard]] int map_height(ZoomLevel zoom);
[[nodiscard]] Size map_size(ZoomLevel zoom);

[[nodiscard]] bool in_map(ZoomLevel zoom, Point p);
[[nodiscard]] bool in_map(ZoomLevel zoom, const Rect& r);
// Clamps into [0, map_width] x [0, map_height]; the far edge stays legal
// because rectangles are half-open.
[[nodiscard]] Point ensure_in_map(ZoomLevel zoom, Point p);
[[nodiscard]] Rect ensure_in_map(ZoomLevel zoom, const Rect& r);

// Degrees -> pixels. Throw std::out_of_range on invalid zoom or coordinates.
[[nodiscard]] int longitude_to_map(ZoomLevel zoom, double longitude);
[[nodiscard]] int latitude_to_map(ZoomLevel zoom, double latitude);
[[nodiscard]] Point geo_to_map(ZoomLevel zoom, const GeoPoint& geo);
[[nodiscard]] Rect geo_to_map(ZoomLevel zoom, const GeoRect& geo);

// Pixels -> degrees. Throw std::out_of_range outside [0, map size].
[[nodiscard]] double map_to_longitude(ZoomLevel zoom, int x);
[[nodiscard]] double map_to_latitude(ZoomLevel zoom, int y);
[[nodiscard]] GeoPoint map_to_geo(ZoomLevel zoom, Point p);
[[nodiscard]] GeoRect map_to_geo(ZoomLevel zoom, const Rect& r);

// Distance in meters using an ellipsoidal (WGS84 radii of curvature) approximation.
[[nodiscard]] double lin_distance_meters(const GeoPoint& a, const GeoPoint& b);

[[nodiscard]] ScaleBarParams scale_bar_params(ZoomLevel zoom);

} // namespace slippymap
