#include "slippymap/settings.h"

#include "slippymap/log.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace slippymap {

NLOHMANN_JSON_SERIALIZE_ENUM(GlyphShape, {
    {GlyphShape::Circle, "circle"},
    {GlyphShape::Square, "square"},
    {GlyphShape::Triangle, "triangle"},
})

static fs::path exe_dir() {
    std::error_code ec;
    auto p = fs::read_symlink("/proc/self/exe", ec);
    if (!ec) return p.parent_path();
    return fs::current_path();
}

std::string settings_path() {
    // Try next to executable first
    auto beside = exe_dir() / "settings.json";
    if (fs::exists(beside)) return beside.string();

    // Fallback to ~/.config/slippymap/settings.json
    const char* home = std::getenv("HOME");
    if (home) {
        auto dir = fs::path(home) / ".config" / "slippymap";
        return (dir / "settings.json").string();
    }
    return beside.string();
}

// JSON serialization helpers

// Colors are [r, g, b] or [r, g, b, a]
static void to_json(json& j, const Color& c) {
    j = json::array({c.r, c.g, c.b, c.a});
}

static void from_json(const json& j, Color& c) {
    const auto v = j.get<std::vector<int>>();
    if (v.size() != 3 && v.size() != 4)
        throw std::invalid_argument(std::format("settings: color needs 3 or 4 components, got {}", v.size()));
    auto channel = [](int value) { return static_cast<uint8_t>(std::clamp(value, 0, 255)); };
    c.r = channel(v[0]);
    c.g = channel(v[1]);
    c.b = channel(v[2]);
    c.a = v.size() == 4 ? channel(v[3]) : 255;
}

static void to_json(json& j, const GeoPoint& p) {
    j = json{{"long", p.longitude}, {"lat", p.latitude}};
}

static void from_json(const json& j, GeoPoint& p) {
    // GeoPoint validates the pair, so both values are read first
    double longitude = p.longitude;
    double latitude = p.latitude;
    if (j.contains("long")) j.at("long").get_to(longitude);
    if (j.contains("lat")) j.at("lat").get_to(latitude);
    p = GeoPoint(longitude, latitude);
}

static void to_json(json& j, const Font& f) {
    j = json{{"family", f.family}, {"size", f.size}, {"bold", f.bold}};
}

static void from_json(const json& j, Font& f) {
    if (j.contains("family")) j.at("family").get_to(f.family);
    if (j.contains("size")) j.at("size").get_to(f.size);
    if (j.contains("bold")) j.at("bold").get_to(f.bold);
}

static void to_json(json& j, const GlyphStyle& s) {
    j = json{{"shape", s.shape}, {"size", s.size}, {"border", s.border_color}, {"background", s.bg_color}};
}

static void from_json(const json& j, GlyphStyle& s) {
    if (j.contains("shape")) j.at("shape").get_to(s.shape);
    if (j.contains("size")) j.at("size").get_to(s.size);
    if (j.contains("border")) j.at("border").get_to(s.border_color);
    if (j.contains("background")) j.at("background").get_to(s.bg_color);
    s.size = std::max(s.size, 1);
}

static void to_json(json& j, const CaptionStyle& s) {
    j = json{
        {"color", s.color}, {"background", s.bg_color},
        {"dx", s.dx}, {"dy", s.dy},
        {"transparent", s.transparent}
    };
}

static void from_json(const json& j, CaptionStyle& s) {
    if (j.contains("color")) j.at("color").get_to(s.color);
    if (j.contains("background")) j.at("background").get_to(s.bg_color);
    if (j.contains("dx")) j.at("dx").get_to(s.dx);
    if (j.contains("dy")) j.at("dy").get_to(s.dy);
    if (j.contains("transparent")) j.at("transparent").get_to(s.transparent);
}

static void to_json(json& j, const MarkStyleDefaults& d) {
    j = json{{"glyph", d.glyph}, {"caption", d.caption}, {"font", d.font}};
}

static void from_json(const json& j, MarkStyleDefaults& d) {
    if (j.contains("glyph")) j.at("glyph").get_to(d.glyph);
    if (j.contains("caption")) j.at("caption").get_to(d.caption);
    if (j.contains("font")) j.at("font").get_to(d.font);
}

static void to_json(json& j, const TileSourceSettings& t) {
    j = json{
        {"prefix", t.url.prefix}, {"pattern", t.url.pattern}, {"postfix", t.url.postfix},
        {"copyright", t.copyright}, {"tiles_dir", t.tiles_dir}
    };
}

static void from_json(const json& j, TileSourceSettings& t) {
    if (j.contains("prefix")) j.at("prefix").get_to(t.url.prefix);
    if (j.contains("pattern")) j.at("pattern").get_to(t.url.pattern);
    if (j.contains("postfix")) j.at("postfix").get_to(t.url.postfix);
    if (j.contains("copyright")) j.at("copyright").get_to(t.copyright);
    if (j.contains("tiles_dir")) j.at("tiles_dir").get_to(t.tiles_dir);
}

static void to_json(json& j, const ViewSettings& v) {
    j = json{
        {"min_zoom", v.min_zoom}, {"max_zoom", v.max_zoom},
        {"start_zoom", v.start_zoom}, {"start_center", v.start_center}
    };
}

static void from_json(const json& j, ViewSettings& v) {
    if (j.contains("min_zoom")) j.at("min_zoom").get_to(v.min_zoom);
    if (j.contains("max_zoom")) j.at("max_zoom").get_to(v.max_zoom);
    if (j.contains("start_zoom")) j.at("start_zoom").get_to(v.start_zoom);
    if (j.contains("start_center")) j.at("start_center").get_to(v.start_center);
}

static void to_json(json& j, const CacheSizing& c) {
    j = json{
        {"default_tiles_h", c.default_tiles_h},
        {"default_tiles_v", c.default_tiles_v},
        {"margin_tiles", c.margin_tiles}
    };
}

static void from_json(const json& j, CacheSizing& c) {
    if (j.contains("default_tiles_h")) j.at("default_tiles_h").get_to(c.default_tiles_h);
    if (j.contains("default_tiles_v")) j.at("default_tiles_v").get_to(c.default_tiles_v);
    if (j.contains("margin_tiles")) j.at("margin_tiles").get_to(c.margin_tiles);
}

static void clamp_settings(Settings& s) {
    s.view.min_zoom = std::clamp(s.view.min_zoom, kMinZoom, kMaxZoom);
    s.view.max_zoom = std::clamp(s.view.max_zoom, s.view.min_zoom, kMaxZoom);
    s.view.start_zoom = std::clamp(s.view.start_zoom, s.view.min_zoom, s.view.max_zoom);

    s.cache.default_tiles_h = std::max(s.cache.default_tiles_h, 1);
    s.cache.default_tiles_v = std::max(s.cache.default_tiles_v, 1);
    s.cache.margin_tiles = std::max(s.cache.margin_tiles, 0);

    s.log_verbosity = std::clamp(s.log_verbosity, 0, 2);
}

Settings load_settings() {
    return load_settings(settings_path());
}

Settings load_settings(const std::string& path) {
    Settings settings;
    std::ifstream f(path);
    if (!f.is_open()) return settings;

    try {
        json j = json::parse(f);
        if (j.contains("tile_source")) j.at("tile_source").get_to(settings.tile_source);
        if (j.contains("view")) j.at("view").get_to(settings.view);
        if (j.contains("cache")) j.at("cache").get_to(settings.cache);
        if (j.contains("options")) {
            const auto& o = j.at("options");
            if (o.contains("draw_copyright")) o.at("draw_copyright").get_to(settings.draw_copyright);
            if (o.contains("draw_scale")) o.at("draw_scale").get_to(settings.draw_scale);
            if (o.contains("background")) o.at("background").get_to(settings.background);
        }
        if (j.contains("mapmarks")) j.at("mapmarks").get_to(settings.mapmarks);
        if (j.contains("log_verbosity")) j.at("log_verbosity").get_to(settings.log_verbosity);
    } catch (const json::exception& e) {
        LOGW("settings parse error:", e.what());
    } catch (const std::logic_error& e) {
        LOGW("settings value error:", e.what());
    }

    clamp_settings(settings);
    return settings;
}

void save_settings(const Settings& settings) {
    save_settings(settings, settings_path());
}

void save_settings(const Settings& settings, const std::string& path) {
    json j;
    j["tile_source"] = settings.tile_source;
    j["view"] = settings.view;
    j["cache"] = settings.cache;
    j["options"] = json{
        {"draw_copyright", settings.draw_copyright},
        {"draw_scale", settings.draw_scale},
        {"background", settings.background}
    };
    j["mapmarks"] = settings.mapmarks;
    j["log_verbosity"] = settings.log_verbosity;

    const auto parent = fs::path(path).parent_path();
    if (!parent.empty()) fs::create_directories(parent);
    std::ofstream f(path);
    if (!f.is_open()) {
        LOGW("cannot write settings to", path);
        return;
    }
    f << j.dump(2) << "\n";
}

MapViewOptions make_map_view_options(const Settings& settings) {
    MapViewOptions options;
    options.draw_copyright = settings.draw_copyright;
    options.draw_scale = settings.draw_scale;
    options.background = settings.background;
    options.copyright = settings.tile_source.copyright;
    options.min_zoom = settings.view.min_zoom;
    options.max_zoom = settings.view.max_zoom;
    options.cache = settings.cache;
    return options;
}

static std::unique_ptr<MapMark> parse_map_mark(const json& item, const MapMarkList& list) {
    auto mark = list.new_item();
    mark->coord = GeoPoint(item.at("long").get<double>(), item.at("lat").get<double>());
    if (item.contains("caption")) item.at("caption").get_to(mark->caption);
    if (item.contains("layer")) {
        const int layer = item.at("layer").get<int>();
        if (layer < 0 || layer > 255)
            throw std::out_of_range(std::format("mapmarks: layer {} out of range", layer));
        mark->layer = static_cast<MapLayer>(layer);
    }
    if (item.contains("visible")) item.at("visible").get_to(mark->visible);
    if (item.contains("glyph")) {
        item.at("glyph").get_to(mark->glyph_style);
        mark->custom_props.glyph_style = true;
    }
    if (item.contains("caption_style")) {
        item.at("caption_style").get_to(mark->caption_style);
        mark->custom_props.caption_style = true;
    }
    if (item.contains("font")) {
        Font font = list.defaults().font;
        item.at("font").get_to(font);
        mark->caption_font = font;
        mark->custom_props.font = true;
    }
    return mark;
}

int load_map_marks(const std::string& path, MapMarkList& list) {
    std::ifstream f(path);
    if (!f.is_open()) throw std::runtime_error("mapmarks: cannot open " + path);

    std::vector<std::unique_ptr<MapMark>> marks;
    try {
        json j = json::parse(f);
        if (!j.is_array()) throw std::runtime_error("mapmarks: " + path + " is not a JSON array");
        for (const auto& item : j) marks.push_back(parse_map_mark(item, list));
    } catch (const json::exception& e) {
        throw std::runtime_error(std::format("mapmarks: {}: {}", path, e.what()));
    }

    list.begin_update();
    for (auto& mark : marks) list.add(std::move(mark));
    list.end_update();

    LOGI("loaded", marks.size(), "mapmarks from", path);
    return static_cast<int>(marks.size());
}

} // namespace slippymap
