#include "png_writer.h"

#include "slippymap/cairo_surface.h"
#include "slippymap/log.h"
#include "slippymap/map_view.h"
#include "slippymap/settings.h"
#include "slippymap/tile_store.h"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace slippymap;

static void print_usage() {
    std::cerr << "Usage: map_render [flags]\n\n"
              << "Renders a map view to PNG.\n\n"
              << "Flags:\n"
              << "  --settings <path>      Settings JSON (default: settings.json beside the binary\n"
              << "                         or ~/.config/slippymap/settings.json)\n"
              << "  --zoom <n>             Zoom level (default: view.start_zoom)\n"
              << "  --center <lon,lat>     View center (default: view.start_center)\n"
              << "  --size <WxH>           Output size in pixels (default: 800x600)\n"
              << "  --tiles <dir>          Tile tree <dir>/<zoom>/<x>/<y>.png\n"
              << "  --marks <path>         Mapmark JSON array\n"
              << "  --layers <n,n,...>     Visible mapmark layers (default: all)\n"
              << "  --list-urls            Print the URLs of the tiles in view and exit\n"
              << "  -o <path>              Output PNG path (default: map.png)\n"
              << "  -v, -vv                Verbose / debug output\n";
}

static bool parse_size(const std::string& s, Size& out) {
    int w = 0, h = 0;
    char extra = 0;
    if (std::sscanf(s.c_str(), "%dx%d%c", &w, &h, &extra) != 2 || w <= 0 || h <= 0) return false;
    out = {w, h};
    return true;
}

static bool parse_center(const std::string& s, GeoPoint& out) {
    double lon = 0, lat = 0;
    char extra = 0;
    if (std::sscanf(s.c_str(), "%lf,%lf%c", &lon, &lat, &extra) != 2) return false;
    try {
        out = GeoPoint(lon, lat);
    } catch (const std::out_of_range&) {
        return false;
    }
    return true;
}

static bool parse_layers(const std::string& s, MapLayers& out) {
    out = layers_none();
    std::istringstream in(s);
    std::string item;
    while (std::getline(in, item, ',')) {
        int layer = -1;
        char extra = 0;
        if (std::sscanf(item.c_str(), "%d%c", &layer, &extra) != 1 || layer < 0 || layer > 255) return false;
        out.set(static_cast<size_t>(layer));
    }
    return true;
}

static void list_tile_urls(const MapView& view, const TileUrlParts& url) {
    const Rect bounds = to_tile_boundary(view.view_rect());
    for (int x = bounds.left; x < bounds.right; x += kTileWidth) {
        for (int y = bounds.top; y < bounds.bottom; y += kTileHeight) {
            const Tile tile{view.zoom(), static_cast<uint32_t>(x / kTileWidth), static_cast<uint32_t>(y / kTileHeight)};
            log::print(tile_to_url(url, tile));
        }
    }
}

int main(int argc, char* argv[]) {
    std::string settings_file;
    std::optional<ZoomLevel> zoom;
    std::optional<GeoPoint> center;
    Size size{800, 600};
    std::string tiles_dir;
    std::string marks_file;
    std::optional<MapLayers> layers;
    bool list_urls = false;
    std::string output = "map.png";
    int verbosity = 0;

    for (int i = 1; i < argc; i++) {
        const bool has_value = i + 1 < argc;
        if (std::strcmp(argv[i], "--settings") == 0 && has_value) {
            settings_file = argv[++i];
        } else if (std::strcmp(argv[i], "--zoom") == 0 && has_value) {
            try {
                zoom = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Error: invalid zoom " << argv[i] << '\n';
                return 1;
            }
        } else if (std::strcmp(argv[i], "--center") == 0 && has_value) {
            GeoPoint p;
            if (!parse_center(argv[++i], p)) {
                std::cerr << "Error: invalid center " << argv[i] << " (expected lon,lat)\n";
                return 1;
            }
            center = p;
        } else if (std::strcmp(argv[i], "--size") == 0 && has_value) {
            if (!parse_size(argv[++i], size)) {
                std::cerr << "Error: invalid size " << argv[i] << " (expected WxH)\n";
                return 1;
            }
        } else if (std::strcmp(argv[i], "--tiles") == 0 && has_value) {
            tiles_dir = argv[++i];
        } else if (std::strcmp(argv[i], "--marks") == 0 && has_value) {
            marks_file = argv[++i];
        } else if (std::strcmp(argv[i], "--layers") == 0 && has_value) {
            MapLayers l;
            if (!parse_layers(argv[++i], l)) {
                std::cerr << "Error: invalid layer list " << argv[i] << '\n';
                return 1;
            }
            layers = l;
        } else if (std::strcmp(argv[i], "--list-urls") == 0) {
            list_urls = true;
        } else if (std::strcmp(argv[i], "-o") == 0 && has_value) {
            output = argv[++i];
        } else if (std::strcmp(argv[i], "-v") == 0) {
            verbosity = std::max(verbosity, 1);
        } else if (std::strcmp(argv[i], "-vv") == 0) {
            verbosity = 2;
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            print_usage();
            return 0;
        } else {
            std::cerr << "Error: unknown argument " << argv[i] << "\n\n";
            print_usage();
            return 1;
        }
    }

    const Settings settings = settings_file.empty() ? load_settings() : load_settings(settings_file);
    log::set_verbosity(std::max(verbosity, settings.log_verbosity));
    LOGI("settings:", settings_file.empty() ? settings_path() : settings_file);

    const ZoomLevel level = zoom.value_or(settings.view.start_zoom);
    if (level < settings.view.min_zoom || level > settings.view.max_zoom) {
        std::cerr << "Error: zoom " << level << " outside [" << settings.view.min_zoom << ", "
                  << settings.view.max_zoom << "]\n";
        return 1;
    }
    if (tiles_dir.empty()) tiles_dir = settings.tile_source.tiles_dir;

    CairoSurfaceFactory factory;
    MapView view(factory, make_map_view_options(settings));
    view.map_marks().defaults() = settings.mapmarks;

    if (!tiles_dir.empty()) {
        LOGI("tiles:", tiles_dir);
        view.handlers().draw_tile = [store = LocalTileStore(tiles_dir)](MapView&, const Tile& tile, Point top_left,
                                                                         Surface& target) {
            return store.draw(tile, top_left, target);
        };
    }

    view.set_viewport_size(size);
    view.set_zoom(level);
    view.set_center_point(center.value_or(settings.view.start_center));
    LOGI("view: zoom", view.zoom(), "scroll", view.scroll_position().x, view.scroll_position().y);

    if (list_urls) {
        list_tile_urls(view, settings.tile_source.url);
        return 0;
    }

    if (!marks_file.empty()) {
        try {
            load_map_marks(marks_file, view.map_marks());
        } catch (const std::exception& e) {
            std::cerr << "Error: loading " << marks_file << ": " << e.what() << '\n';
            return 1;
        }
    }
    if (layers) view.set_visible_layers(*layers);

    try {
        CairoSurface out(size.width, size.height);
        view.paint(out);

        PngWriter writer(output, size.width, size.height);
        writer.write_image(out.to_rgba());
        writer.finish();
    } catch (const std::exception& e) {
        std::cerr << "Error: rendering " << output << ": " << e.what() << '\n';
        return 1;
    }

    std::cerr << "Output: " << output << " (" << size.width << "x" << size.height << ", zoom " << view.zoom()
              << ")\n";
    return 0;
}
