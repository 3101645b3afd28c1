#include "map_interaction_controller.h"

#include "slippymap/log.h"

using slippymap::Point;
using slippymap::Rect;

MapInteractionController::MapInteractionController(slippymap::MapView& view)
    : view_(view) {}

void MapInteractionController::set_mouse_mode(MouseMode mode) {
    if (mouse_mode_ == mode) return;
    cancel();
    gesture_ = Gesture::None;
    mouse_mode_ = mode;
}

Point MapInteractionController::clamp_to_map(Point p) const {
    return view_.map_to_view(slippymap::ensure_in_map(view_.zoom(), view_.view_to_map(p)));
}

void MapInteractionController::press(Point p) {
    gesture_ = Gesture::None;
    if (!slippymap::in_map(view_.zoom(), view_.view_to_map(p))) return;

    switch (mouse_mode_) {
        case MouseMode::Drag:
            // Marks under the cursor keep the press for themselves
            if (view_.hit_test(p) != slippymap::MapMarkList::kNotFound) return;
            gesture_ = Gesture::Pan;
            last_pos_ = p;
            break;
        case MouseMode::Select:
            gesture_ = Gesture::Select;
            band_start_ = p;
            band_end_ = p;
            break;
    }
}

void MapInteractionController::motion(Point p) {
    switch (gesture_) {
        case Gesture::Pan: {
            const Point delta = last_pos_ - p;
            last_pos_ = p;
            if (delta.x != 0 || delta.y != 0) view_.scroll_by(delta.x, delta.y);
            break;
        }
        case Gesture::Select:
            band_end_ = clamp_to_map(p);
            if (view_.handlers().invalidate) view_.handlers().invalidate();
            break;
        case Gesture::None:
            break;
    }
}

void MapInteractionController::release(Point p) {
    motion(p);
    if (gesture_ == Gesture::Select) {
        gesture_ = Gesture::None;
        const Rect band = Rect::normalized(band_start_, band_end_);
        LOGD("selection", band.left, band.top, band.right, band.bottom);
        view_.notify_selection(band);
        if (view_.handlers().invalidate) view_.handlers().invalidate();
        return;
    }
    gesture_ = Gesture::None;
}

bool MapInteractionController::cancel() {
    if (gesture_ != Gesture::Select) return false;
    gesture_ = Gesture::None;
    if (view_.handlers().invalidate) view_.handlers().invalidate();
    return true;
}

void MapInteractionController::wheel(Point p, double direction) {
    if (direction == 0.0) return;
    const int step = direction > 0.0 ? 1 : -1;
    const Point anchor = slippymap::ensure_in_map(view_.zoom(), view_.view_to_map(p));
    view_.set_zoom(view_.zoom() + step, anchor);
}

std::optional<Rect> MapInteractionController::selection_rect() const {
    if (gesture_ != Gesture::Select) return std::nullopt;
    return Rect::normalized(band_start_, band_end_);
}
