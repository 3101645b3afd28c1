#include "slippymap/settings.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

using namespace slippymap;
namespace fs = std::filesystem;

namespace {

class TempDir {
public:
    TempDir() {
        path_ = fs::temp_directory_path() /
                ("slippymap_settings_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(path_);
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    [[nodiscard]] std::string file(const std::string& name, const std::string& content) const {
        auto p = path_ / name;
        std::ofstream f(p);
        f << content;
        return p.string();
    }

    [[nodiscard]] std::string path(const std::string& name) const { return (path_ / name).string(); }

private:
    fs::path path_;
};

} // namespace

TEST(Settings, MissingFileGivesDefaults) {
    TempDir dir;
    const Settings s = load_settings(dir.path("absent.json"));

    EXPECT_EQ(s.tile_source.url.prefix, "http://tile.openstreetmap.org/");
    EXPECT_EQ(s.tile_source.url.pattern, "{zoom}/{x}/{y}.png");
    EXPECT_EQ(s.tile_source.copyright, "(c) OpenStreetMap contributors");
    EXPECT_EQ(s.view.min_zoom, kMinZoom);
    EXPECT_EQ(s.view.max_zoom, kMaxZoom);
    EXPECT_EQ(s.cache.default_tiles_h, 8);
    EXPECT_EQ(s.cache.margin_tiles, 2);
    EXPECT_TRUE(s.draw_copyright);
    EXPECT_EQ(s.log_verbosity, 0);
}

TEST(Settings, PartialFileKeepsOtherDefaults) {
    TempDir dir;
    const auto path = dir.file("partial.json", R"({
        "tile_source": {"prefix": "https://tiles.example.org/", "postfix": "?key=1"},
        "view": {"start_zoom": 6, "start_center": {"long": 13.4, "lat": 52.5}},
        "options": {"draw_scale": false, "background": [10, 20, 30]},
        "mapmarks": {"glyph": {"shape": "triangle", "size": 14}}
    })");

    const Settings s = load_settings(path);
    EXPECT_EQ(s.tile_source.url.prefix, "https://tiles.example.org/");
    EXPECT_EQ(s.tile_source.url.pattern, "{zoom}/{x}/{y}.png");
    EXPECT_EQ(tile_to_url(s.tile_source.url, Tile{6, 34, 21}), "https://tiles.example.org/6/34/21.png?key=1");
    EXPECT_EQ(s.view.start_zoom, 6);
    EXPECT_DOUBLE_EQ(s.view.start_center.longitude, 13.4);
    EXPECT_DOUBLE_EQ(s.view.start_center.latitude, 52.5);
    EXPECT_TRUE(s.draw_copyright);
    EXPECT_FALSE(s.draw_scale);
    EXPECT_EQ(s.background, (Color{10, 20, 30, 255}));
    EXPECT_EQ(s.mapmarks.glyph.shape, GlyphShape::Triangle);
    EXPECT_EQ(s.mapmarks.glyph.size, 14);
    EXPECT_EQ(s.mapmarks.glyph.bg_color, colors::kSkyBlue);
}

TEST(Settings, MalformedFileGivesDefaults) {
    TempDir dir;
    const auto path = dir.file("broken.json", "{ \"view\": { \"min_zoom\": ");
    const Settings s = load_settings(path);
    EXPECT_EQ(s.view.min_zoom, kMinZoom);
    EXPECT_EQ(s.view.start_zoom, 2);
}

TEST(Settings, OutOfRangeValuesAreClamped) {
    TempDir dir;
    const auto path = dir.file("clamp.json", R"({
        "view": {"min_zoom": -3, "max_zoom": 30, "start_zoom": 25},
        "cache": {"default_tiles_h": 0, "margin_tiles": -1},
        "log_verbosity": 7
    })");

    const Settings s = load_settings(path);
    EXPECT_EQ(s.view.min_zoom, 0);
    EXPECT_EQ(s.view.max_zoom, 19);
    EXPECT_EQ(s.view.start_zoom, 19);
    EXPECT_EQ(s.cache.default_tiles_h, 1);
    EXPECT_EQ(s.cache.margin_tiles, 0);
    EXPECT_EQ(s.log_verbosity, 2);
}

TEST(Settings, InvalidStartCenterKeepsDefault) {
    TempDir dir;
    const auto path = dir.file("center.json", R"({"view": {"start_center": {"long": 10, "lat": 89}}})");
    const Settings s = load_settings(path);
    EXPECT_EQ(s.view.start_center, GeoPoint());
}

TEST(Settings, SaveThenLoad) {
    TempDir dir;
    Settings s;
    s.tile_source.url.prefix = "file:///tiles/";
    s.tile_source.tiles_dir = "/srv/tiles";
    s.tile_source.copyright = "(c) me";
    s.view.min_zoom = 3;
    s.view.max_zoom = 12;
    s.view.start_zoom = 9;
    s.view.start_center = GeoPoint(-0.1276, 51.5072);
    s.cache.margin_tiles = 1;
    s.draw_copyright = false;
    s.background = Color{1, 2, 3, 4};
    s.mapmarks.caption.dx = 9;
    s.mapmarks.caption.transparent = false;
    s.mapmarks.font = Font{"Serif", 10.5, true};
    s.log_verbosity = 1;

    const auto path = dir.path("nested/settings.json");
    save_settings(s, path);
    const Settings loaded = load_settings(path);

    EXPECT_EQ(loaded.tile_source.url.prefix, "file:///tiles/");
    EXPECT_EQ(loaded.tile_source.tiles_dir, "/srv/tiles");
    EXPECT_EQ(loaded.tile_source.copyright, "(c) me");
    EXPECT_EQ(loaded.view.min_zoom, 3);
    EXPECT_EQ(loaded.view.max_zoom, 12);
    EXPECT_EQ(loaded.view.start_zoom, 9);
    EXPECT_EQ(loaded.view.start_center, s.view.start_center);
    EXPECT_EQ(loaded.cache.margin_tiles, 1);
    EXPECT_FALSE(loaded.draw_copyright);
    EXPECT_EQ(loaded.background, (Color{1, 2, 3, 4}));
    EXPECT_EQ(loaded.mapmarks.caption, s.mapmarks.caption);
    EXPECT_EQ(loaded.mapmarks.font, s.mapmarks.font);
    EXPECT_EQ(loaded.log_verbosity, 1);
}

TEST(Settings, MapViewOptionsFromSettings) {
    Settings s;
    s.view.min_zoom = 2;
    s.view.max_zoom = 15;
    s.draw_scale = false;
    s.tile_source.copyright = "(c) tiles";
    s.cache.default_tiles_h = 4;

    const MapViewOptions options = make_map_view_options(s);
    EXPECT_EQ(options.min_zoom, 2);
    EXPECT_EQ(options.max_zoom, 15);
    EXPECT_FALSE(options.draw_scale);
    EXPECT_TRUE(options.draw_copyright);
    EXPECT_EQ(options.copyright, "(c) tiles");
    EXPECT_EQ(options.cache.default_tiles_h, 4);
}

TEST(MapMarkFile, LoadsMarksInOneBatch) {
    TempDir dir;
    const auto path = dir.file("marks.json", R"([
        {"long": 13.405, "lat": 52.52, "caption": "Berlin", "layer": 2},
        {"long": 2.3522, "lat": 48.8566, "caption": "Paris", "layer": 1,
         "glyph": {"shape": "square", "size": 12}},
        {"long": -0.1276, "lat": 51.5072, "caption": "London", "visible": false,
         "caption_style": {"dx": 8, "transparent": false}, "font": {"size": 11}}
    ])");

    MapMarkList list;
    list.defaults().font.family = "Default";
    int changed = 0;
    list.set_changed_notify([&] { ++changed; });

    EXPECT_EQ(load_map_marks(path, list), 3);
    EXPECT_EQ(changed, 1);
    ASSERT_EQ(list.count(), 3);

    EXPECT_EQ(list.get(0).caption, "London");
    EXPECT_FALSE(list.get(0).visible);
    EXPECT_TRUE(list.get(0).custom_props.caption_style);
    EXPECT_EQ(list.get(0).caption_style.dx, 8);
    ASSERT_TRUE(list.get(0).caption_font.has_value());
    EXPECT_EQ(list.get(0).caption_font->family, "Default");
    EXPECT_DOUBLE_EQ(list.get(0).caption_font->size, 11.0);

    EXPECT_EQ(list.get(1).caption, "Paris");
    EXPECT_TRUE(list.get(1).custom_props.glyph_style);
    EXPECT_EQ(list.get(1).glyph_style.shape, GlyphShape::Square);
    EXPECT_EQ(list.get(1).glyph_style.size, 12);

    EXPECT_EQ(list.get(2).caption, "Berlin");
    EXPECT_FALSE(list.get(2).custom_props.glyph_style);
    EXPECT_DOUBLE_EQ(list.get(2).coord.latitude, 52.52);
}

TEST(MapMarkFile, InvalidEntryAddsNothing) {
    TempDir dir;
    const auto path = dir.file("bad.json", R"([
        {"long": 13.405, "lat": 52.52, "caption": "ok"},
        {"long": 10.0, "lat": 88.0, "caption": "too far north"}
    ])");

    MapMarkList list;
    EXPECT_THROW(load_map_marks(path, list), std::out_of_range);
    EXPECT_EQ(list.count(), 0);

    const auto no_lat = dir.file("nolat.json", R"([{"long": 1.0}])");
    EXPECT_THROW(load_map_marks(no_lat, list), std::runtime_error);
    const auto not_array = dir.file("object.json", R"({"long": 1.0, "lat": 2.0})");
    EXPECT_THROW(load_map_marks(not_array, list), std::runtime_error);
    EXPECT_THROW(load_map_marks(dir.path("missing.json"), list), std::runtime_error);
    EXPECT_EQ(list.count(), 0);
}
