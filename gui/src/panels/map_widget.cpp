#include "map_widget.h"

#include "slippymap/log.h"

#include <cmath>
#include <vector>

using slippymap::Point;

namespace {

Point to_point(double x, double y) {
    return {static_cast<int>(std::floor(x)), static_cast<int>(std::floor(y))};
}

}  // namespace

MapWidget::MapWidget(const slippymap::MapViewOptions& options)
    : view_(std::make_unique<slippymap::MapView>(factory_, options)),
      controller_(*view_) {
    set_hexpand(true);
    set_vexpand(true);
    set_size_request(320, 240);
    set_focusable(true);

    view_->handlers().invalidate = [this]() { queue_draw(); };

    set_draw_func(sigc::mem_fun(*this, &MapWidget::draw));
    signal_resize().connect([this](int width, int height) {
        view_->set_viewport_size({width, height});
        if (pending_center_ && width > 0 && height > 0) {
            view_->set_center_point(*pending_center_);
            pending_center_.reset();
        }
        notify_status();
    });

    drag_ = Gtk::GestureDrag::create();
    drag_->set_button(GDK_BUTTON_PRIMARY);
    drag_->signal_drag_begin().connect([this](double x, double y) {
        drag_start_x_ = x;
        drag_start_y_ = y;
        controller_.press(to_point(x, y));
    });
    drag_->signal_drag_update().connect([this](double dx, double dy) {
        controller_.motion(to_point(drag_start_x_ + dx, drag_start_y_ + dy));
        notify_status();
    });
    drag_->signal_drag_end().connect([this](double dx, double dy) {
        controller_.release(to_point(drag_start_x_ + dx, drag_start_y_ + dy));
        notify_status();
    });
    add_controller(drag_);

    click_focus_ = Gtk::GestureClick::create();
    click_focus_->set_button(GDK_BUTTON_PRIMARY);
    click_focus_->signal_pressed().connect([this](int, double, double) { grab_focus(); });
    add_controller(click_focus_);

    motion_ = Gtk::EventControllerMotion::create();
    motion_->signal_motion().connect([this](double x, double y) {
        pointer_x_ = x;
        pointer_y_ = y;
    });
    add_controller(motion_);

    scroll_zoom_ = Gtk::EventControllerScroll::create();
    scroll_zoom_->set_flags(Gtk::EventControllerScroll::Flags::VERTICAL |
                            Gtk::EventControllerScroll::Flags::DISCRETE);
    scroll_zoom_->signal_scroll().connect([this](double, double dy) -> bool {
        // Scrolling up zooms in
        controller_.wheel(to_point(pointer_x_, pointer_y_), -dy);
        notify_status();
        return true;
    }, false);
    add_controller(scroll_zoom_);

    key_ = Gtk::EventControllerKey::create();
    key_->signal_key_pressed().connect(
        [this](guint keyval, guint, Gdk::ModifierType state) -> bool {
            const auto modifiers = Gdk::ModifierType::SHIFT_MASK | Gdk::ModifierType::CONTROL_MASK |
                                   Gdk::ModifierType::ALT_MASK;
            const bool no_modifiers = (state & modifiers) == Gdk::ModifierType(0);
            if (keyval == GDK_KEY_Escape && no_modifiers) return controller_.cancel();
            return false;
        }, false);
    add_controller(key_);
}

void MapWidget::center_on(const slippymap::GeoPoint& geo) {
    const auto size = view_->viewport_size();
    if (size.width > 0 && size.height > 0) {
        view_->set_center_point(geo);
        pending_center_.reset();
    } else {
        pending_center_ = geo;
    }
}

void MapWidget::draw(const Cairo::RefPtr<Cairo::Context>& cr, int width, int height) {
    if (view_->viewport_size() != slippymap::Size{width, height})
        view_->set_viewport_size({width, height});

    slippymap::CairoSurface target(cr, width, height);
    try {
        view_->paint(target);
    } catch (const std::exception& e) {
        LOGE("[gui] map paint failed:", e.what());
    }
    draw_selection(cr);
}

void MapWidget::draw_selection(const Cairo::RefPtr<Cairo::Context>& cr) {
    const auto band = controller_.selection_rect();
    if (!band || band->empty()) return;

    cr->save();
    cr->set_line_width(1.0);
    cr->set_dash(std::vector<double>{4.0, 2.0, 1.0, 2.0}, 0.0);
    cr->set_operator(Cairo::Context::Operator::DIFFERENCE);
    cr->set_source_rgb(1.0, 1.0, 1.0);
    cr->rectangle(band->left + 0.5, band->top + 0.5, band->width() - 1.0, band->height() - 1.0);
    cr->stroke();
    cr->restore();
}

void MapWidget::notify_status() {
    if (on_status_changed_) on_status_changed_();
}
