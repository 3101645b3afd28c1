#include "slippymap/map_view.h"

#include "slippymap/log.h"
#include "slippymap/map_painter.h"

#include <algorithm>
#include <format>
#include <stdexcept>
#include <utility>

namespace slippymap {

namespace {

void check_zoom_level(ZoomLevel level) {
    if (!zoom_valid(level))
        throw std::out_of_range(std::format("map view: invalid zoom level {}", level));
}

} // namespace

MapView::MapView(SurfaceFactory& factory, MapViewOptions options)
    : factory_(factory), options_(std::move(options)), cache_(factory, options_.cache) {
    check_zoom_level(options_.min_zoom);
    check_zoom_level(options_.max_zoom);
    if (options_.min_zoom > options_.max_zoom)
        throw std::invalid_argument("map view: min zoom exceeds max zoom");

    marks_.set_changed_notify([this] { invalidate(); });

    // zoom_ starts out of range so the first set_zoom always applies.
    set_zoom(options_.min_zoom);
}

void MapView::set_draw_copyright(bool draw) {
    options_.draw_copyright = draw;
    invalidate();
}

void MapView::set_draw_scale(bool draw) {
    options_.draw_scale = draw;
    if (draw && !scale_bar_) scale_bar_ = render_scale_bar(factory_, zoom_);
    invalidate();
}

void MapView::set_background(Color color) {
    options_.background = color;
    update_cache();
    invalidate();
}

void MapView::set_copyright(std::string text) {
    options_.copyright = std::move(text);
    copyright_.reset();
    invalidate();
}

void MapView::set_zoom(ZoomLevel level, Point anchor) {
    if (level < options_.min_zoom || level > options_.max_zoom) return;
    if (level == zoom_) return;

    // Geo coordinates of the anchor are taken before the zoom changes
    const GeoPoint anchor_geo =
        zoom_valid(zoom_) ? map_to_geo(anchor) : slippymap::map_to_geo(kMinZoom, Point{0, 0});
    const Point anchor_offset = anchor - scroll_;

    [[maybe_unused]] const ZoomLevel old_zoom = zoom_;
    zoom_ = level;
    map_size_ = slippymap::map_size(zoom_);

    if (options_.draw_scale) scale_bar_ = render_scale_bar(factory_, zoom_);
    else scale_bar_.reset();

    const Point new_nw = geo_to_map(anchor_geo) - anchor_offset;
    scroll_.x = std::clamp(new_nw.x, 0, scroll_range().x);
    scroll_.y = std::clamp(new_nw.y, 0, scroll_range().y);

    cache_.resize(viewport_, map_size_);
    if (!cache_.covers(view_rect())) cache_.reposition(view_rect(), map_size_);
    update_cache();

    LOGD("zoom", old_zoom, "->", zoom_, "scroll", scroll_.x, scroll_.y);

    invalidate();
    if (handlers_.zoom_changed) handlers_.zoom_changed(*this);
}

void MapView::set_zoom(ZoomLevel level) {
    set_zoom(level, scroll_);
}

void MapView::set_min_zoom(ZoomLevel level) {
    check_zoom_level(level);
    if (level > options_.max_zoom)
        throw std::invalid_argument(std::format("map view: min zoom {} exceeds max zoom {}", level, options_.max_zoom));

    options_.min_zoom = level;
    if (zoom_ < options_.min_zoom) set_zoom(options_.min_zoom);
}

void MapView::set_max_zoom(ZoomLevel level) {
    check_zoom_level(level);
    if (level < options_.min_zoom)
        throw std::invalid_argument(std::format("map view: max zoom {} below min zoom {}", level, options_.min_zoom));

    options_.max_zoom = level;
    if (zoom_ > options_.max_zoom) set_zoom(options_.max_zoom);
}

void MapView::zoom_to_area(const GeoRect& area) {
    // Per axis, the first zoom where the area no longer fits into the viewport
    ZoomLevel zoom_h = options_.max_zoom;
    for (ZoomLevel z = zoom_; z <= options_.max_zoom; ++z) {
        if (slippymap::geo_to_map(z, area).width() > viewport_.width) {
            zoom_h = z;
            break;
        }
    }
    ZoomLevel zoom_v = options_.max_zoom;
    for (ZoomLevel z = zoom_; z <= options_.max_zoom; ++z) {
        if (slippymap::geo_to_map(z, area).height() > viewport_.height) {
            zoom_v = z;
            break;
        }
    }

    set_zoom(std::min(zoom_h, zoom_v));
    set_nw_point(area.top_left);
}

void MapView::zoom_to_fit() {
    zoom_to_area(map_to_geo(Rect::from_size({}, map_size_)));
}

void MapView::set_viewport_size(Size size) {
    viewport_ = {std::max(size.width, 0), std::max(size.height, 0)};
    scroll_.x = std::clamp(scroll_.x, 0, scroll_range().x);
    scroll_.y = std::clamp(scroll_.y, 0, scroll_range().y);

    if (cache_.resize(viewport_, map_size_)) {
        cache_.reposition(view_rect(), map_size_);
        update_cache();
    }
    invalidate();
}

Point MapView::scroll_range() const {
    return {std::max(map_size_.width - viewport_.width, 0), std::max(map_size_.height - viewport_.height, 0)};
}

Rect MapView::view_rect() const {
    return Rect::from_size(scroll_, viewport_).intersect(Rect::from_size({}, map_size_));
}

void MapView::scroll_by(int dx, int dy) {
    scroll_to(scroll_.x + dx, scroll_.y + dy);
}

void MapView::scroll_to(int x, int y) {
    const Point range = scroll_range();
    scroll_ = {std::clamp(x, 0, range.x), std::clamp(y, 0, range.y)};
    invalidate();
}

GeoPoint MapView::center_point() const {
    return map_to_geo(view_rect().center());
}

void MapView::set_center_point(const GeoPoint& geo) {
    const Point center = geo_to_map(geo);
    set_nw_point(Point{center.x - viewport_.width / 2, center.y - viewport_.height / 2});
}

GeoPoint MapView::nw_point() const {
    return map_to_geo(view_rect().top_left());
}

void MapView::set_nw_point(const GeoPoint& geo) {
    set_nw_point(geo_to_map(geo));
}

void MapView::set_nw_point(Point map_point) {
    scroll_to(map_point.x, map_point.y);
}

GeoPoint MapView::map_to_geo(Point p) const {
    return slippymap::map_to_geo(zoom_, p);
}

GeoRect MapView::map_to_geo(const Rect& r) const {
    return slippymap::map_to_geo(zoom_, r);
}

Point MapView::geo_to_map(const GeoPoint& geo) const {
    return slippymap::geo_to_map(zoom_, geo);
}

Rect MapView::geo_to_map(const GeoRect& geo) const {
    return slippymap::geo_to_map(zoom_, geo);
}

void MapView::set_visible_layers(const MapLayers& layers) {
    visible_layers_ = layers;
    invalidate();
}

int MapView::hit_test(Point view_point) const {
    const Point map_point = view_to_map(view_point);
    if (!in_map(zoom_, map_point)) return MapMarkList::kNotFound;
    return marks_.find(map_to_geo(map_point), true);
}

void MapView::notify_selection(const Rect& selection) {
    const Rect normalized = Rect::normalized(selection.top_left(), selection.bottom_right());
    const Rect map_rect = ensure_in_map(zoom_, view_to_map(normalized));
    const GeoRect geo = map_to_geo(map_rect);
    if (handlers_.selection_box) handlers_.selection_box(*this, geo);
}

void MapView::paint(Surface& target, Point origin) {
    ensure_cache();

    const Rect view = view_rect();
    // Map smaller than the viewport, the rest shows the background
    if (view.size() != viewport_) target.fill_rect(Rect::from_size(origin, viewport_), options_.background);
    if (const Surface* image = cache_.image()) target.blit(*image, cache_.to_local(view), origin);

    if (options_.draw_copyright) {
        if (!copyright_) copyright_ = render_copyright(factory_, options_.copyright);
        target.blit(*copyright_, Rect::from_size({}, copyright_->size()),
                    origin + Point{viewport_.width - copyright_->width() - kLabelMargin,
                                   viewport_.height - copyright_->height() - kLabelMargin});
    }

    if (options_.draw_scale && scale_bar_) {
        target.blit(*scale_bar_, Rect::from_size({}, scale_bar_->size()),
                    origin + Point{kLabelMargin, viewport_.height - scale_bar_->height() - kLabelMargin});
    }

    if (marks_.empty()) return;

    // The map may be smaller than the viewport
    const GeoRect view_geo = map_to_geo(ensure_in_map(zoom_, view));
    int idx = MapMarkList::kNotFound;
    while ((idx = marks_.find(view_geo, true, idx)) != MapMarkList::kNotFound) {
        draw_map_mark(target, origin, marks_.get(idx));
    }
}

void MapView::refresh_tile(const Tile& tile) {
    if (cache_.refresh_tile(tile, *this)) invalidate();
}

void MapView::draw_tile(const Tile& tile, Point top_left, Surface& target) {
    if (handlers_.draw_tile && handlers_.draw_tile(*this, tile, top_left, target)) return;
    if (handlers_.draw_tile_loading && handlers_.draw_tile_loading(*this, tile, top_left, target)) return;
    draw_tile_placeholder(target, tile, top_left, options_.background);
}

void MapView::draw_map_mark(Surface& target, Point origin, MapMark& mark) {
    if (!mark.visible || !visible_layers_.test(mark.layer)) return;

    const Point point = map_to_view(geo_to_map(mark.coord)) + origin;
    if (handlers_.draw_map_mark && handlers_.draw_map_mark(*this, target, point, mark)) return;
    // The callback may have hidden the mark
    if (!mark.visible) return;

    const ResolvedMarkStyle style = resolve_style(marks_.defaults(), mark);
    const Rect glyph = glyph_rect(point, style.glyph.size);
    draw_glyph(target, glyph, style.glyph);
    draw_caption(target, glyph, mark.caption, style.caption, style.font);
}

void MapView::ensure_cache() {
    const Rect view = view_rect();
    if (cache_.covers(view)) return;
    cache_.reposition(view, map_size_);
    update_cache();
}

void MapView::update_cache() {
    cache_.repaint(zoom_, map_size_, *this, options_.background);
}

void MapView::invalidate() {
    if (handlers_.invalidate) handlers_.invalidate();
}

} // namespace slippymap
