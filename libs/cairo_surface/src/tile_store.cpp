#include "slippymap/tile_store.h"

#include "slippymap/cairo_surface.h"
#include "slippymap/log.h"

#include <string>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace slippymap {

LocalTileStore::LocalTileStore(fs::path root)
    : root_(std::move(root)) {}

fs::path LocalTileStore::tile_path(const Tile& tile) const {
    return root_ / std::to_string(tile.zoom) / std::to_string(tile.x) / (std::to_string(tile.y) + ".png");
}

bool LocalTileStore::has_tile(const Tile& tile) const {
    std::error_code ec;
    return fs::is_regular_file(tile_path(tile), ec);
}

bool LocalTileStore::draw(const Tile& tile, Point top_left, Surface& target) const {
    if (!has_tile(tile)) {
        LOGD("tile missing:", tile_to_string(tile));
        return false;
    }

    const auto path = tile_path(tile).string();
    try {
        const auto image = CairoSurface::from_png(path);
        const Rect src = Rect::from_size({}, image->size()).intersect({0, 0, kTileWidth, kTileHeight});
        target.blit(*image, src, top_left);
    } catch (const std::exception& e) {
        LOGW_ONCE(log::detail::fnv1a_hash(path.c_str()), "cannot draw tile", path, e.what());
        return false;
    }
    return true;
}

} // namespace slippymap
