#pragma once

#include "slippymap/map_view.h"
#include "slippymap/mapmarks.h"
#include "slippymap/projection.h"
#include "slippymap/surface.h"
#include "slippymap/viewport_cache.h"

#include <string>

namespace slippymap {

struct TileSourceSettings {
    TileUrlParts url;
    std::string copyright = "(c) OpenStreetMap contributors";
    // Local tile tree laid out as <dir>/<zoom>/<x>/<y>.png. Empty = none.
    std::string tiles_dir;
};

struct ViewSettings {
    ZoomLevel min_zoom = kMinZoom;
    ZoomLevel max_zoom = kMaxZoom;
    ZoomLevel start_zoom = 2;
    GeoPoint start_center;
};

struct Settings {
    TileSourceSettings tile_source;
    ViewSettings view;
    CacheSizing cache;

    bool draw_copyright = true;
    bool draw_scale = true;
    Color background = colors::kBtnFace;

    MarkStyleDefaults mapmarks;

    int log_verbosity = 0; // 0 = quiet, 1 = verbose, 2 = debug
};

// Returns the path to the settings JSON file.
std::string settings_path();

// Load settings from disk. Returns defaults if the file doesn't exist or
// can't be parsed; out-of-range values are clamped.
Settings load_settings();
Settings load_settings(const std::string& path);

// Save settings to disk, creating the parent directory.
void save_settings(const Settings& settings);
void save_settings(const Settings& settings, const std::string& path);

MapViewOptions make_map_view_options(const Settings& settings);

// Reads a JSON array of mapmarks into `list` inside one update bracket.
// Nothing is added if any entry is invalid. Returns the number of marks added.
// Throws std::runtime_error if the file can't be read or parsed and
// std::out_of_range for coordinates outside the map.
int load_map_marks(const std::string& path, MapMarkList& list);

} // namespace slippymap
