#include "slippymap/projection.h"

#include <algorithm>
#include <cmath>
#include <format>
#include <numbers>
#include <stdexcept>
#include <string_view>

namespace slippymap {

namespace {

// Floor guard: a pixel edge computed through the inverse transform may land a
// few ulps below the integer it came from.
constexpr double kPixelEpsilon = 1e-6;

constexpr std::array<double, kMaxZoom + 1> kScaleBarWidthKm = {
    10000, 5000, 3000, 1000, 500, 300, 200, 100, 50, 30,
    10, 5, 3, 1, 0.500, 0.300, 0.200, 0.100, 0.050, 0.020,
};

void replace_all(std::string& text, std::string_view token, const std::string& value) {
    for (size_t pos = text.find(token); pos != std::string::npos; pos = text.find(token, pos + value.size()))
        text.replace(pos, token.size(), value);
}

void check_zoom(ZoomLevel zoom) {
    if (!zoom_valid(zoom))
        throw std::out_of_range(std::format("projection: invalid zoom {}", zoom));
}

void check_longitude(double longitude) {
    if (!(longitude >= kMinLongitude && longitude <= kMaxLongitude))
        throw std::out_of_range(std::format("projection: longitude {} out of range", longitude));
}

void check_latitude(double latitude) {
    if (!(latitude >= kMinLatitude && latitude <= kMaxLatitude))
        throw std::out_of_range(std::format("projection: latitude {} out of range", latitude));
}

void check_map_x(ZoomLevel zoom, int x) {
    if (x < 0 || x > map_width(zoom))
        throw std::out_of_range(std::format("projection: map x {} out of range at zoom {}", x, zoom));
}

void check_map_y(ZoomLevel zoom, int y) {
    if (y < 0 || y > map_height(zoom))
        throw std::out_of_range(std::format("projection: map y {} out of range at zoom {}", y, zoom));
}

} // namespace

GeoPoint::GeoPoint(double longitude, double latitude) : longitude(longitude), latitude(latitude) {
    check_longitude(longitude);
    check_latitude(latitude);
}

bool GeoRect::contains(const GeoPoint& p) const {
    // Latitude decreases from top to bottom.
    return p.longitude >= top_left.longitude && p.longitude <= bottom_right.longitude &&
           p.latitude >= bottom_right.latitude && p.latitude <= top_left.latitude;
}

uint32_t tile_count(ZoomLevel zoom) {
    check_zoom(zoom);
    return 1u << zoom;
}

bool tile_valid(const Tile& tile) {
    return zoom_valid(tile.zoom) && tile.x < tile_count(tile.zoom) && tile.y < tile_count(tile.zoom);
}

std::string tile_to_string(const Tile& tile) {
    return std::format("{} * [{} : {}]", tile.zoom, tile.x, tile.y);
}

std::string tile_to_url(const TileUrlParts& parts, const Tile& tile) {
    std::string path = parts.pattern;
    replace_all(path, "{zoom}", std::to_string(tile.zoom));
    replace_all(path, "{x}", std::to_string(tile.x));
    replace_all(path, "{y}", std::to_string(tile.y));
    return parts.prefix + path + parts.postfix;
}

Point tile_origin(const Tile& tile) {
    if (!tile_valid(tile))
        throw std::out_of_range("projection: invalid tile " + tile_to_string(tile));
    return {static_cast<int>(tile.x) * kTileWidth, static_cast<int>(tile.y) * kTileHeight};
}

Rect to_tile_boundary(const Rect& r) {
    return {
        to_tile_width_lesser(r.left),
        to_tile_height_lesser(r.top),
        to_tile_width_greater(r.right),
        to_tile_height_greater(r.bottom),
    };
}

int map_width(ZoomLevel zoom) {
    return static_cast<int>(tile_count(zoom)) * kTileWidth;
}

int map_height(ZoomLevel zoom) {
    return static_cast<int>(tile_count(zoom)) * kTileHeight;
}

Size map_size(ZoomLevel zoom) {
    return {map_width(zoom), map_height(zoom)};
}

bool in_map(ZoomLevel zoom, Point p) {
    return Rect::from_size({}, map_size(zoom)).contains(p);
}

bool in_map(ZoomLevel zoom, const Rect& r) {
    return Rect::from_size({}, map_size(zoom)).contains(r);
}

Point ensure_in_map(ZoomLevel zoom, Point p) {
    return {std::clamp(p.x, 0, map_width(zoom)), std::clamp(p.y, 0, map_height(zoom))};
}

Rect ensure_in_map(ZoomLevel zoom, const Rect& r) {
    return Rect::from_points(ensure_in_map(zoom, r.top_left()), ensure_in_map(zoom, r.bottom_right()));
}

int longitude_to_map(ZoomLevel zoom, double longitude) {
    check_zoom(zoom);
    check_longitude(longitude);

    const double x = (longitude + 180.0) / 360.0 * map_width(zoom);
    const int result = static_cast<int>(std::floor(x + kPixelEpsilon));

    check_map_x(zoom, result);
    return result;
}

int latitude_to_map(ZoomLevel zoom, double latitude) {
    check_zoom(zoom);
    check_latitude(latitude);

    constexpr double pi = std::numbers::pi;
    const double lat_rad = latitude * pi / 180.0;
    const double y = (1.0 - std::log(std::tan(lat_rad) + 1.0 / std::cos(lat_rad)) / pi) / 2.0 *
                     map_height(zoom);
    // Latitudes between the Mercator limit (~85.0511) and 85.1 project just
    // outside the surface; they belong to the edge row.
    const int result = std::clamp(static_cast<int>(std::floor(y + kPixelEpsilon)), 0, map_height(zoom));

    check_map_y(zoom, result);
    return result;
}

Point geo_to_map(ZoomLevel zoom, const GeoPoint& geo) {
    return {longitude_to_map(zoom, geo.longitude), latitude_to_map(zoom, geo.latitude)};
}

Rect geo_to_map(ZoomLevel zoom, const GeoRect& geo) {
    return Rect::from_points(geo_to_map(zoom, geo.top_left), geo_to_map(zoom, geo.bottom_right));
}

double map_to_longitude(ZoomLevel zoom, int x) {
    check_zoom(zoom);
    check_map_x(zoom, x);

    return static_cast<double>(x) / map_width(zoom) * 360.0 - 180.0;
}

double map_to_latitude(ZoomLevel zoom, int y) {
    check_zoom(zoom);
    check_map_y(zoom, y);

    constexpr double pi = std::numbers::pi;
    const double n = pi - 2.0 * pi * y / map_height(zoom);
    return 180.0 / pi * std::atan(std::sinh(n));
}

GeoPoint map_to_geo(ZoomLevel zoom, Point p) {
    return GeoPoint(map_to_longitude(zoom, p.x), map_to_latitude(zoom, p.y));
}

GeoRect map_to_geo(ZoomLevel zoom, const Rect& r) {
    return {map_to_geo(zoom, r.top_left()), map_to_geo(zoom, r.bottom_right())};
}

double lin_distance_meters(const GeoPoint& a, const GeoPoint& b) {
    // The truncated degree->radian factor is kept so distances match
    // values produced by other tools using the same formula.
    constexpr double d2r = 0.017453;
    constexpr double semi_major = 6378137.0;
    constexpr double e2 = 0.006739496742337;

    const double d_lambda = (a.longitude - b.longitude) * d2r;
    const double d_phi = (a.latitude - b.latitude) * d2r;
    const double phi_mean = ((a.latitude + b.latitude) / 2.0) * d2r;

    const double sin_phi_mean = std::sin(phi_mean);
    const double temp = 1.0 - e2 * sin_phi_mean * sin_phi_mean;
    const double rho = (semi_major * (1.0 - e2)) / std::pow(temp, 1.5);
    const double nu = semi_major / std::sqrt(1.0 - e2 * sin_phi_mean * sin_phi_mean);

    const double s_phi = std::sin(d_phi / 2.0);
    const double s_lambda = std::sin(d_lambda / 2.0);
    double z = std::sqrt(s_phi * s_phi +
                         std::cos(b.latitude * d2r) * std::cos(a.latitude * d2r) * s_lambda * s_lambda);
    z = 2.0 * std::asin(std::min(z, 1.0));
    if (z == 0.0) return 0.0;

    double alpha = std::cos(b.latitude * d2r) * std::sin(d_lambda) / std::sin(z);
    alpha = std::asin(std::clamp(alpha, -1.0, 1.0));

    const double sin_alpha = std::sin(alpha);
    const double cos_alpha = std::cos(alpha);
    const double r = (rho * nu) / (rho * sin_alpha * sin_alpha + nu * cos_alpha * cos_alpha);

    return z * r;
}

ScaleBarParams scale_bar_params(ZoomLevel zoom) {
    check_zoom(zoom);

    const double width_m = kScaleBarWidthKm[static_cast<size_t>(zoom)] * 1000.0;
    ScaleBarParams params;
    params.width_px = static_cast<int>(std::lround(width_m / kMetersPerPixelOnEquator[static_cast<size_t>(zoom)]));
    params.width_m = static_cast<int>(std::lround(width_m));

    if (params.width_m < 1000)
        params.text = std::format("{} m", params.width_m);
    else
        params.text = std::format("{} km", params.width_m / 1000);
    return params;
}

} // namespace slippymap
