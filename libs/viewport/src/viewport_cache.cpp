#include "slippymap/viewport_cache.h"

#include "slippymap/log.h"

#include <algorithm>
#include <stdexcept>

namespace slippymap {

ViewportCache::ViewportCache(SurfaceFactory& factory, CacheSizing sizing)
    : factory_(factory), sizing_(sizing) {
    if (sizing_.default_tiles_h <= 0 || sizing_.default_tiles_v <= 0 || sizing_.margin_tiles < 0)
        throw std::invalid_argument("viewport cache: invalid sizing");
}

bool ViewportCache::covers(const Rect& view) const {
    return image_ && rect_.contains(view);
}

bool ViewportCache::resize(Size control_size, Size map_size) {
    // Control rounded up to whole tiles
    const int ctrl_w = to_tile_width_greater(std::max(control_size.width, 0));
    const int ctrl_h = to_tile_height_greater(std::max(control_size.height, 0));

    // A view straddling tile borders spans one tile more than its rounded size.
    const int need_w = ctrl_w + std::max(2 * sizing_.margin_tiles, 1) * kTileWidth;
    const int need_h = ctrl_h + std::max(2 * sizing_.margin_tiles, 1) * kTileHeight;

    Size size;
    size.width = std::min(std::max(need_w, sizing_.default_tiles_h * kTileWidth), map_size.width);
    size.height = std::min(std::max(need_h, sizing_.default_tiles_v * kTileHeight), map_size.height);

    if (image_ && rect_.size() == size) return false;

    rect_ = Rect::from_size(rect_.top_left(), size);
    image_ = factory_.create(size.width, size.height);
    painted_zoom_ = -1;
    LOGD("cache resized to", size.width, "x", size.height);
    return true;
}

void ViewportCache::reposition(const Rect& view, Size map_size) {
    const Rect aligned = to_tile_boundary(view);
    const Size size = rect_.size();

    const int max_margin_h = sizing_.margin_tiles * kTileWidth;
    const int max_margin_v = sizing_.margin_tiles * kTileHeight;
    const int margin_h = std::min(to_tile_width_lesser(std::max(size.width - aligned.width(), 0) / 2), max_margin_h);
    const int margin_v = std::min(to_tile_height_lesser(std::max(size.height - aligned.height(), 0) / 2), max_margin_v);

    Point origin{aligned.left - margin_h, aligned.top - margin_v};
    origin.x = std::clamp(origin.x, 0, std::max(map_size.width - size.width, 0));
    origin.y = std::clamp(origin.y, 0, std::max(map_size.height - size.height, 0));

    rect_ = Rect::from_size(origin, size);
    LOGD("cache moved to", rect_.left, rect_.top, rect_.right, rect_.bottom);
}

void ViewportCache::repaint(ZoomLevel zoom, Size map_size, TileDrawer& drawer, Color background) {
    if (!image_) return;

    image_->fill_rect(Rect::from_size({}, image_->size()), background);

    const int count_h = std::max(std::min(map_size.width - rect_.left, rect_.width()), 0) / kTileWidth;
    const int count_v = std::max(std::min(map_size.height - rect_.top, rect_.height()), 0) / kTileHeight;
    const int first_h = rect_.left / kTileWidth;
    const int first_v = rect_.top / kTileHeight;

    for (int horz = 0; horz < count_h; ++horz) {
        for (int vert = 0; vert < count_v; ++vert) {
            const Tile tile{zoom, static_cast<uint32_t>(first_h + horz), static_cast<uint32_t>(first_v + vert)};
            drawer.draw_tile(tile, Point{horz * kTileWidth, vert * kTileHeight}, *image_);
        }
    }
    painted_zoom_ = zoom;
}

bool ViewportCache::refresh_tile(const Tile& tile, TileDrawer& drawer) {
    const Point origin = tile_origin(tile);
    if (!image_ || tile.zoom != painted_zoom_) return false;

    const Rect tile_rect = Rect::from_size(origin, {kTileWidth, kTileHeight});
    if (!rect_.contains(tile_rect)) return false;

    drawer.draw_tile(tile, to_inner(rect_.top_left(), origin), *image_);
    return true;
}

} // namespace slippymap
