#pragma once

#include "slippymap/mapmarks.h"
#include "slippymap/projection.h"
#include "slippymap/surface.h"
#include "slippymap/viewport_cache.h"

#include <functional>
#include <memory>
#include <string>

namespace slippymap {

class MapView;

// Host callbacks. Every one is optional. Drawing callbacks return true when
// they handled the drawing completely.
struct MapViewHandlers {
    // Supplies the tile image; `top_left` is in `target` coordinates.
    std::function<bool(MapView& view, const Tile& tile, Point top_left, Surface& target)> draw_tile;
    // Custom placeholder for tiles not available yet.
    std::function<bool(MapView& view, const Tile& tile, Point top_left, Surface& target)> draw_tile_loading;
    // Called before drawing each mark. May draw the mark itself or change its
    // properties (including hiding it) before the default drawing.
    std::function<bool(MapView& view, Surface& target, Point point, MapMark& mark)> draw_map_mark;
    std::function<void(MapView& view)> zoom_changed;
    std::function<void(MapView& view, const GeoRect& rect)> selection_box;
    // The view needs repainting.
    std::function<void()> invalidate;
};

struct MapViewOptions {
    bool draw_copyright = true;
    bool draw_scale = true;
    Color background = colors::kBtnFace;
    std::string copyright = "(c) OpenStreetMap contributors";
    ZoomLevel min_zoom = kMinZoom;
    ZoomLevel max_zoom = kMaxZoom;
    CacheSizing cache;
};

// Scrollable, zoomable view of the map surface. Owns zoom and scroll state,
// the tile cache and the mapmark list, and composes the view on paint.
//
// Coordinate spaces: "map" is absolute pixels on the map surface at the
// current zoom, "view" is relative to the top-left of the viewport.
class MapView : private TileDrawer {
public:
    explicit MapView(SurfaceFactory& factory, MapViewOptions options = {});
    ~MapView() override = default;

    MapView(const MapView&) = delete;
    MapView& operator=(const MapView&) = delete;

    [[nodiscard]] MapViewHandlers& handlers() { return handlers_; }
    [[nodiscard]] MapMarkList& map_marks() { return marks_; }
    [[nodiscard]] const MapMarkList& map_marks() const { return marks_; }
    [[nodiscard]] const MapViewOptions& options() const { return options_; }

    void set_draw_copyright(bool draw);
    void set_draw_scale(bool draw);
    void set_background(Color color);
    void set_copyright(std::string text);

    // Zoom

    [[nodiscard]] ZoomLevel zoom() const { return zoom_; }
    [[nodiscard]] ZoomLevel min_zoom() const { return options_.min_zoom; }
    [[nodiscard]] ZoomLevel max_zoom() const { return options_.max_zoom; }

    // Changes the zoom keeping the map point `anchor` at the same view
    // position. Levels outside [min_zoom, max_zoom] or equal to the current
    // one are ignored.
    void set_zoom(ZoomLevel level, Point anchor);
    // Anchored at the view's top-left corner.
    void set_zoom(ZoomLevel level);

    // Throw std::out_of_range for an invalid level and std::invalid_argument
    // when min would exceed max. The current zoom is clamped into the new range.
    void set_min_zoom(ZoomLevel level);
    void set_max_zoom(ZoomLevel level);

    void zoom_to_area(const GeoRect& area);
    void zoom_to_fit();

    // Scroll

    [[nodiscard]] Size viewport_size() const { return viewport_; }
    void set_viewport_size(Size size);

    [[nodiscard]] Size map_size() const { return map_size_; }
    [[nodiscard]] Point scroll_position() const { return scroll_; }
    // Largest scroll position on each axis.
    [[nodiscard]] Point scroll_range() const;
    // Visible part of the map, in map coordinates.
    [[nodiscard]] Rect view_rect() const;

    void scroll_by(int dx, int dy);
    void scroll_to(int x, int y);

    [[nodiscard]] GeoPoint center_point() const;
    void set_center_point(const GeoPoint& geo);
    [[nodiscard]] GeoPoint nw_point() const;
    void set_nw_point(const GeoPoint& geo);
    void set_nw_point(Point map_point);

    // Coordinate conversion

    [[nodiscard]] Point view_to_map(Point p) const { return to_outer(scroll_, p); }
    [[nodiscard]] Rect view_to_map(const Rect& r) const { return to_outer(scroll_, r); }
    [[nodiscard]] Point map_to_view(Point p) const { return to_inner(scroll_, p); }
    [[nodiscard]] Rect map_to_view(const Rect& r) const { return to_inner(scroll_, r); }

    [[nodiscard]] GeoPoint map_to_geo(Point p) const;
    [[nodiscard]] GeoRect map_to_geo(const Rect& r) const;
    [[nodiscard]] Point geo_to_map(const GeoPoint& geo) const;
    [[nodiscard]] Rect geo_to_map(const GeoRect& geo) const;

    // Mapmarks

    [[nodiscard]] const MapLayers& visible_layers() const { return visible_layers_; }
    void set_visible_layers(const MapLayers& layers);

    // Index of the first mark under `view_point`, MapMarkList::kNotFound if none.
    [[nodiscard]] int hit_test(Point view_point) const;

    // Fires selection_box with the geo rect of the view rectangle
    // `selection`, normalized and clamped to the map.
    void notify_selection(const Rect& selection);

    // Painting

    // Composes the view onto `target` with the view's top-left at `origin`.
    void paint(Surface& target, Point origin = {});

    // Redraws `tile` in the cache if the cache holds it, e.g. after the tile
    // image arrived.
    void refresh_tile(const Tile& tile);

    [[nodiscard]] const ViewportCache& cache() const { return cache_; }
    [[nodiscard]] const Surface* scale_bar() const { return scale_bar_.get(); }
    [[nodiscard]] const Surface* copyright_label() const { return copyright_.get(); }

private:
    void draw_tile(const Tile& tile, Point top_left, Surface& target) override;
    void draw_map_mark(Surface& target, Point origin, MapMark& mark);
    void ensure_cache();
    void update_cache();
    void invalidate();

    SurfaceFactory& factory_;
    MapViewOptions options_;
    MapViewHandlers handlers_;
    MapMarkList marks_;
    MapLayers visible_layers_ = layers_all();

    ZoomLevel zoom_ = -1;
    Size map_size_;
    Size viewport_;
    Point scroll_;

    ViewportCache cache_;
    std::unique_ptr<Surface> copyright_;
    std::unique_ptr<Surface> scale_bar_;
};

} // namespace slippymap
