#include "map_window.h"

#include "slippymap/log.h"

#include <format>

using slippymap::GeoPoint;
using slippymap::GeoRect;
using slippymap::MapView;

MapWindow::MapWindow(const slippymap::Settings& settings, const std::string& marks_file)
    : map_(slippymap::make_map_view_options(settings)) {
    set_title("Slippy Map");
    set_default_size(1024, 768);

    toolbar_.set_margin(4);
    toolbar_.append(zoom_out_button_);
    toolbar_.append(zoom_in_button_);
    toolbar_.append(fit_button_);
    toolbar_.append(select_button_);
    status_label_.set_hexpand(true);
    status_label_.set_xalign(0.0f);
    toolbar_.append(status_label_);
    toolbar_.append(selection_label_);

    root_.append(toolbar_);
    root_.append(map_);
    set_child(root_);

    auto& view = map_.view();
    view.map_marks().defaults() = settings.mapmarks;
    setup_tiles(settings);

    zoom_out_button_.signal_clicked().connect([this]() { map_.view().set_zoom(map_.view().zoom() - 1); });
    zoom_in_button_.signal_clicked().connect([this]() { map_.view().set_zoom(map_.view().zoom() + 1); });
    fit_button_.signal_clicked().connect([this]() { map_.view().zoom_to_fit(); });
    select_button_.signal_toggled().connect([this]() {
        map_.controller().set_mouse_mode(select_button_.get_active() ? MapInteractionController::MouseMode::Select
                                                                     : MapInteractionController::MouseMode::Drag);
    });

    view.handlers().zoom_changed = [this](MapView&) { update_status(); };
    view.handlers().selection_box = [this](MapView&, const GeoRect& rect) {
        const auto text = std::format("Selected {:.4f}, {:.4f} .. {:.4f}, {:.4f}",
                                      rect.top_left.longitude, rect.top_left.latitude,
                                      rect.bottom_right.longitude, rect.bottom_right.latitude);
        LOGI("[gui]", text);
        selection_label_.set_text(text);
    };
    map_.set_on_status_changed([this]() { update_status(); });

    view.set_zoom(settings.view.start_zoom);
    map_.center_on(settings.view.start_center);

    if (!marks_file.empty()) load_marks(marks_file);
    update_status();
}

void MapWindow::setup_tiles(const slippymap::Settings& settings) {
    if (settings.tile_source.tiles_dir.empty()) {
        LOGI("[gui] no tiles_dir configured, drawing placeholders");
        return;
    }
    tiles_.emplace(settings.tile_source.tiles_dir);
    map_.view().handlers().draw_tile = [this](MapView&, const slippymap::Tile& tile, slippymap::Point top_left,
                                              slippymap::Surface& target) {
        return tiles_->draw(tile, top_left, target);
    };
}

void MapWindow::load_marks(const std::string& path) {
    try {
        slippymap::load_map_marks(path, map_.view().map_marks());
    } catch (const std::exception& e) {
        LOGW("[gui] cannot load mapmarks", path, e.what());
        selection_label_.set_text("Mapmarks not loaded: " + std::string(e.what()));
    }
}

void MapWindow::update_status() {
    const auto& view = map_.view();
    if (view.viewport_size().width == 0 || view.viewport_size().height == 0) {
        status_label_.set_text(std::format("Zoom {}", view.zoom()));
        return;
    }
    const GeoPoint center = view.center_point();
    status_label_.set_text(std::format("Zoom {}  |  {:.5f}, {:.5f}", view.zoom(), center.longitude, center.latitude));
}
