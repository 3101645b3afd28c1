#pragma once

#include "slippymap/projection.h"
#include "slippymap/surface.h"

#include <any>
#include <bitset>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace slippymap {

enum class GlyphShape { Circle, Square, Triangle };

struct GlyphStyle {
    GlyphShape shape = GlyphShape::Circle;
    int size = 20;
    Color border_color = colors::kWindowFrame;
    Color bg_color = colors::kSkyBlue;

    friend bool operator==(const GlyphStyle&, const GlyphStyle&) = default;
};

struct CaptionStyle {
    Color color = colors::kBlack;
    Color bg_color = colors::kWindow;
    int dx = 3;
    int dy = 0;
    bool transparent = true;

    friend bool operator==(const CaptionStyle&, const CaptionStyle&) = default;
};

// Which visual properties a mark takes from itself instead of the owner's defaults.
struct CustomProps {
    bool glyph_style = false;
    bool caption_style = false;
    bool font = false;
};

using MapLayer = uint8_t;
using MapLayers = std::bitset<256>;

[[nodiscard]] inline MapLayers layers_all() { return MapLayers{}.set(); }
[[nodiscard]] inline MapLayers layers_none() { return MapLayers{}; }

struct MapMark {
    GeoPoint coord;
    std::string caption;
    bool visible = true;
    MapLayer layer = 0;
    std::any user_data;

    CustomProps custom_props;
    GlyphStyle glyph_style;
    CaptionStyle caption_style;
    std::optional<Font> caption_font;
};

// Owner-level defaults new marks start from and non-customized marks are drawn with.
struct MarkStyleDefaults {
    GlyphStyle glyph;
    CaptionStyle caption;
    Font font;
};

struct ResolvedMarkStyle {
    GlyphStyle glyph;
    CaptionStyle caption;
    Font font;
};

// Effective style of `mark`: each property comes from the mark when its
// custom flag is set (and, for the font, a font is present), else from `defaults`.
[[nodiscard]] ResolvedMarkStyle resolve_style(const MarkStyleDefaults& defaults, const MapMark& mark);

enum class ListAction { Added, Removed, Extracted };

// Mapmarks sorted by layer (stable among equal layers) and painted in this order.
class MapMarkList {
public:
    static constexpr int kNotFound = -1;

    using ItemNotify = std::function<void(MapMark& item, ListAction action)>;
    using ChangedNotify = std::function<void()>;

    MapMarkList() = default;
    ~MapMarkList();
    MapMarkList(const MapMarkList&) = delete;
    MapMarkList& operator=(const MapMarkList&) = delete;

    // Visible mark initialised from the current defaults, not yet in the list.
    [[nodiscard]] std::unique_ptr<MapMark> new_item() const;
    MapMark& add(std::unique_ptr<MapMark> mark);
    MapMark& add(const GeoPoint& coord, std::string caption, MapLayer layer = 0);
    // Destroys the mark. Marks not in the list are ignored.
    void remove(const MapMark& mark);
    // Releases ownership of the mark to the caller; nullptr if not in the list.
    [[nodiscard]] std::unique_ptr<MapMark> extract(const MapMark& mark);
    void clear();

    [[nodiscard]] int count() const { return static_cast<int>(items_.size()); }
    [[nodiscard]] bool empty() const { return items_.empty(); }
    // Throws std::out_of_range.
    [[nodiscard]] MapMark& get(int index);
    [[nodiscard]] const MapMark& get(int index) const;

    // First mark at `coords` at or after `start_index` (-1 starts from the beginning).
    // `consider_size` is reserved for widening the search by the glyph size
    // and is not applied yet.
    [[nodiscard]] int find(const GeoPoint& coords, bool consider_size = true, int start_index = -1) const;
    // Next mark inside `rect` after `prev_index`.
    [[nodiscard]] int find(const GeoRect& rect, bool consider_size = true, int prev_index = -1) const;

    void begin_update();
    void end_update();
    [[nodiscard]] bool updating() const { return update_count_ > 0; }

    void set_item_notify(ItemNotify fn) { on_item_notify_ = std::move(fn); }
    void set_changed_notify(ChangedNotify fn) { on_changed_ = std::move(fn); }

    [[nodiscard]] MarkStyleDefaults& defaults() { return defaults_; }
    [[nodiscard]] const MarkStyleDefaults& defaults() const { return defaults_; }

private:
    using Items = std::vector<std::unique_ptr<MapMark>>;

    [[nodiscard]] Items::iterator locate(const MapMark& mark);
    void notify(MapMark& item, ListAction action);
    void changed();

    Items items_;
    MarkStyleDefaults defaults_;
    int update_count_ = 0;
    ItemNotify on_item_notify_;
    ChangedNotify on_changed_;
};

// Floating point equality with a relative tolerance (1e-12, at least 1e-12 absolute).
[[nodiscard]] bool same_value(double a, double b);

} // namespace slippymap
