#pragma once

#include "panels/map_widget.h"

#include "slippymap/settings.h"
#include "slippymap/tile_store.h"

#include <gtkmm.h>

#include <optional>
#include <string>

class MapWindow : public Gtk::ApplicationWindow {
public:
    MapWindow(const slippymap::Settings& settings, const std::string& marks_file);

private:
    void setup_tiles(const slippymap::Settings& settings);
    void load_marks(const std::string& path);
    void update_status();

    std::optional<slippymap::LocalTileStore> tiles_;

    Gtk::Box root_{Gtk::Orientation::VERTICAL};
    Gtk::Box toolbar_{Gtk::Orientation::HORIZONTAL, 4};
    Gtk::Button zoom_out_button_{"-"};
    Gtk::Button zoom_in_button_{"+"};
    Gtk::Button fit_button_{"Fit"};
    Gtk::ToggleButton select_button_{"Select"};
    Gtk::Label status_label_;
    Gtk::Label selection_label_;
    MapWidget map_;
};
