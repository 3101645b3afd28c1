#pragma once

#include "domain/map_interaction_types.h"

#include "slippymap/map_view.h"

#include <optional>

// Maps pointer and key input to MapView operations. All points are in view
// coordinates. Toolkit-free so the widget only forwards events.
class MapInteractionController {
public:
    using MouseMode = mapinteraction::MouseMode;
    using Gesture = mapinteraction::Gesture;

    explicit MapInteractionController(slippymap::MapView& view);

    [[nodiscard]] MouseMode mouse_mode() const { return mouse_mode_; }
    void set_mouse_mode(MouseMode mode);

    [[nodiscard]] Gesture gesture() const { return gesture_; }

    // Left button pressed. Presses outside the map start nothing.
    void press(slippymap::Point p);
    void motion(slippymap::Point p);
    void release(slippymap::Point p);

    // Escape. Returns true if a selection was cancelled.
    bool cancel();

    // Wheel step: positive zooms in, negative zooms out. Anchored at `p`.
    void wheel(slippymap::Point p, double direction);

    // Normalized rubber band while selecting.
    [[nodiscard]] std::optional<slippymap::Rect> selection_rect() const;

private:
    [[nodiscard]] slippymap::Point clamp_to_map(slippymap::Point p) const;

    slippymap::MapView& view_;
    MouseMode mouse_mode_ = MouseMode::Drag;
    Gesture gesture_ = Gesture::None;
    slippymap::Point last_pos_;
    slippymap::Point band_start_;
    slippymap::Point band_end_;
};
