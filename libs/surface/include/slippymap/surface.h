#pragma once

#include "slippymap/geometry.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace slippymap {

struct Color {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
    uint8_t a = 255;

    friend constexpr bool operator==(const Color&, const Color&) = default;
};

namespace colors {
constexpr Color kBlack{0, 0, 0};
constexpr Color kWhite{255, 255, 255};
constexpr Color kGray{128, 128, 128};
constexpr Color kDarkGray{128, 128, 128};
constexpr Color kSilver{192, 192, 192};
constexpr Color kGreen{0, 128, 0};
constexpr Color kSkyBlue{166, 202, 240};
constexpr Color kWindow{255, 255, 255};
constexpr Color kWindowFrame{100, 100, 100};
constexpr Color kBtnFace{240, 240, 240};
constexpr Color kTransparent{0, 0, 0, 0};
} // namespace colors

struct Font {
    std::string family = "Sans";
    double size = 8.0; // points
    bool bold = false;

    friend bool operator==(const Font&, const Font&) = default;
};

// Drawing target used by the map core: the cache image, label bitmaps and
// the host's output all implement it. Shapes are filled with `fill` and
// outlined with a one pixel `border`.
class Surface {
public:
    virtual ~Surface() = default;

    [[nodiscard]] virtual int width() const = 0;
    [[nodiscard]] virtual int height() const = 0;

    virtual void fill_rect(const Rect& r, Color color) = 0;
    virtual void draw_rect(const Rect& r, Color fill, Color border) = 0;
    virtual void draw_ellipse(const Rect& bounds, Color fill, Color border) = 0;
    virtual void draw_polygon(const std::vector<Point>& points, Color fill, Color border) = 0;

    [[nodiscard]] virtual Size text_extent(std::string_view text, const Font& font) const = 0;
    // `top_left` is the top-left corner of the text extent box. No background
    // is painted when `background` is empty.
    virtual void draw_text(Point top_left, std::string_view text, const Font& font, Color color,
                           std::optional<Color> background) = 0;

    // Copies `src_rect` of `src` to `dst` on this surface. Backends accept
    // sources created by their own factory and throw std::invalid_argument
    // otherwise.
    virtual void blit(const Surface& src, const Rect& src_rect, Point dst) = 0;

    [[nodiscard]] Size size() const { return {width(), height()}; }
};

// Allocates offscreen surfaces (cache image, label bitmaps) compatible with
// the host's output surface.
class SurfaceFactory {
public:
    virtual ~SurfaceFactory() = default;

    // Newly created surfaces are fully transparent.
    [[nodiscard]] virtual std::unique_ptr<Surface> create(int width, int height) = 0;
    [[nodiscard]] virtual Size text_extent(std::string_view text, const Font& font) const = 0;
};

} // namespace slippymap
