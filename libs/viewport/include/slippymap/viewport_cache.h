#pragma once

#include "slippymap/projection.h"
#include "slippymap/surface.h"

#include <memory>

namespace slippymap {

// Cache capacity. Memory of the image is 4 bytes * 65536 px per tile, so the
// default 8x8 tiles take 16.7 MB.
struct CacheSizing {
    int default_tiles_h = 8;
    int default_tiles_v = 8;
    // Whole tiles kept around the view on each side.
    int margin_tiles = 2;
};

// Draws tile `tile` with its top-left corner at `top_left` of `target`.
class TileDrawer {
public:
    virtual ~TileDrawer() = default;
    virtual void draw_tile(const Tile& tile, Point top_left, Surface& target) = 0;
};

// Tile-aligned raster of the map region around the view. It is repositioned
// and repainted only when the view leaves it.
class ViewportCache {
public:
    explicit ViewportCache(SurfaceFactory& factory, CacheSizing sizing = {});

    [[nodiscard]] const Rect& rect() const { return rect_; }
    [[nodiscard]] const Surface* image() const { return image_.get(); }
    [[nodiscard]] const CacheSizing& sizing() const { return sizing_; }
    [[nodiscard]] ZoomLevel painted_zoom() const { return painted_zoom_; }

    [[nodiscard]] bool covers(const Rect& view) const;

    // Picks the desired cache size for a control of `control_size` on a map of
    // `map_size`. Reallocates the image only if the size changed; returns
    // whether it did.
    bool resize(Size control_size, Size map_size);

    // Moves the cache over the tile-aligned `view`, centering the spare
    // tiles around it and keeping the cache inside the map.
    void reposition(const Rect& view, Size map_size);

    // Clears the image and draws every tile the cache holds.
    void repaint(ZoomLevel zoom, Size map_size, TileDrawer& drawer, Color background);

    // Redraws a single tile in place. Returns false when the tile is not part
    // of the current cache contents. Throws std::out_of_range for an invalid tile.
    bool refresh_tile(const Tile& tile, TileDrawer& drawer);

    // Map coordinates -> cache image coordinates.
    [[nodiscard]] Rect to_local(const Rect& map_rect) const { return to_inner(rect_.top_left(), map_rect); }

private:
    SurfaceFactory& factory_;
    CacheSizing sizing_;
    Rect rect_;
    std::unique_ptr<Surface> image_;
    ZoomLevel painted_zoom_ = -1;
};

} // namespace slippymap
