#pragma once

#include "app/map_interaction_controller.h"

#include "slippymap/cairo_surface.h"
#include "slippymap/map_view.h"

#include <gtkmm.h>

#include <functional>
#include <memory>
#include <optional>

// Drawing area showing a MapView. Forwards size, draw, pointer and key
// events; the interaction itself lives in MapInteractionController.
class MapWidget : public Gtk::DrawingArea {
public:
    explicit MapWidget(const slippymap::MapViewOptions& options);

    [[nodiscard]] slippymap::MapView& view() { return *view_; }
    [[nodiscard]] MapInteractionController& controller() { return controller_; }

    void set_on_status_changed(std::function<void()> cb) { on_status_changed_ = std::move(cb); }

    // Centers the view on `geo` now, or once the widget has a size.
    void center_on(const slippymap::GeoPoint& geo);

private:
    void draw(const Cairo::RefPtr<Cairo::Context>& cr, int width, int height);
    void draw_selection(const Cairo::RefPtr<Cairo::Context>& cr);
    void notify_status();

    slippymap::CairoSurfaceFactory factory_;
    std::unique_ptr<slippymap::MapView> view_;
    MapInteractionController controller_;

    Glib::RefPtr<Gtk::GestureDrag> drag_;
    Glib::RefPtr<Gtk::GestureClick> click_focus_;
    Glib::RefPtr<Gtk::EventControllerScroll> scroll_zoom_;
    Glib::RefPtr<Gtk::EventControllerMotion> motion_;
    Glib::RefPtr<Gtk::EventControllerKey> key_;

    double drag_start_x_ = 0.0;
    double drag_start_y_ = 0.0;
    double pointer_x_ = 0.0;
    double pointer_y_ = 0.0;

    std::optional<slippymap::GeoPoint> pending_center_;
    std::function<void()> on_status_changed_;
};
