#include "slippymap/mapmarks.h"

#include <algorithm>
#include <cmath>
#include <format>
#include <stdexcept>

namespace slippymap {

namespace {

constexpr double kDoubleResolution = 1e-12;

bool layer_less(MapLayer layer, const std::unique_ptr<MapMark>& item) {
    return layer < item->layer;
}

bool item_layer_less(const std::unique_ptr<MapMark>& item, MapLayer layer) {
    return item->layer < layer;
}

} // namespace

bool same_value(double a, double b) {
    const double epsilon = std::max(std::min(std::fabs(a), std::fabs(b)) * kDoubleResolution, kDoubleResolution);
    return std::fabs(a - b) <= epsilon;
}

ResolvedMarkStyle resolve_style(const MarkStyleDefaults& defaults, const MapMark& mark) {
    ResolvedMarkStyle style;
    style.glyph = mark.custom_props.glyph_style ? mark.glyph_style : defaults.glyph;
    style.caption = mark.custom_props.caption_style ? mark.caption_style : defaults.caption;
    style.font = (mark.custom_props.font && mark.caption_font) ? *mark.caption_font : defaults.font;
    return style;
}

MapMarkList::~MapMarkList() {
    // Owners release per-mark resources through the item notification.
    update_count_ = 1;
    on_changed_ = nullptr;
    clear();
}

std::unique_ptr<MapMark> MapMarkList::new_item() const {
    auto mark = std::make_unique<MapMark>();
    mark->visible = true;
    mark->glyph_style = defaults_.glyph;
    mark->caption_style = defaults_.caption;
    return mark;
}

MapMark& MapMarkList::add(std::unique_ptr<MapMark> mark) {
    if (!mark) throw std::invalid_argument("mapmarks: cannot add a null mark");

    // After all marks of the same layer, so equal layers keep insertion order.
    auto pos = std::upper_bound(items_.begin(), items_.end(), mark->layer, layer_less);
    auto it = items_.insert(pos, std::move(mark));
    MapMark& added = **it;

    notify(added, ListAction::Added);
    changed();
    return added;
}

MapMark& MapMarkList::add(const GeoPoint& coord, std::string caption, MapLayer layer) {
    auto mark = new_item();
    mark->coord = coord;
    mark->caption = std::move(caption);
    mark->layer = layer;
    return add(std::move(mark));
}

MapMarkList::Items::iterator MapMarkList::locate(const MapMark& mark) {
    auto first = std::lower_bound(items_.begin(), items_.end(), mark.layer, item_layer_less);
    auto last = std::upper_bound(first, items_.end(), mark.layer, layer_less);
    auto it = std::find_if(first, last, [&](const auto& item) { return item.get() == &mark; });
    return it == last ? items_.end() : it;
}

void MapMarkList::remove(const MapMark& mark) {
    auto it = locate(mark);
    if (it != items_.end()) {
        std::unique_ptr<MapMark> owned = std::move(*it);
        items_.erase(it);
        notify(*owned, ListAction::Removed);
    }
    changed();
}

std::unique_ptr<MapMark> MapMarkList::extract(const MapMark& mark) {
    auto it = locate(mark);
    if (it == items_.end()) return nullptr;

    std::unique_ptr<MapMark> owned = std::move(*it);
    items_.erase(it);
    notify(*owned, ListAction::Extracted);
    changed();
    return owned;
}

void MapMarkList::clear() {
    Items removed;
    removed.swap(items_);
    for (auto& item : removed) notify(*item, ListAction::Removed);
    changed();
}

MapMark& MapMarkList::get(int index) {
    if (index < 0 || index >= count())
        throw std::out_of_range(std::format("mapmarks: index {} out of range (count {})", index, count()));
    return *items_[static_cast<size_t>(index)];
}

const MapMark& MapMarkList::get(int index) const {
    if (index < 0 || index >= count())
        throw std::out_of_range(std::format("mapmarks: index {} out of range (count {})", index, count()));
    return *items_[static_cast<size_t>(index)];
}

int MapMarkList::find(const GeoPoint& coords, bool /*consider_size*/, int start_index) const {
    for (int i = std::max(start_index, 0); i < count(); ++i) {
        const MapMark& mark = *items_[static_cast<size_t>(i)];
        if (same_value(coords.longitude, mark.coord.longitude) && same_value(coords.latitude, mark.coord.latitude))
            return i;
    }
    return kNotFound;
}

int MapMarkList::find(const GeoRect& rect, bool /*consider_size*/, int prev_index) const {
    for (int i = std::max(prev_index + 1, 0); i < count(); ++i) {
        if (rect.contains(items_[static_cast<size_t>(i)]->coord)) return i;
    }
    return kNotFound;
}

void MapMarkList::begin_update() {
    ++update_count_;
}

void MapMarkList::end_update() {
    if (update_count_ > 0) --update_count_;
    changed();
}

void MapMarkList::notify(MapMark& item, ListAction action) {
    if (on_item_notify_) on_item_notify_(item, action);
}

void MapMarkList::changed() {
    if (update_count_ == 0 && on_changed_) on_changed_();
}

} // namespace slippymap
