#pragma once

#include "slippymap/surface.h"

#include <cairomm/cairomm.h>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace slippymap {

// Surface drawing with cairo. Either owns an ARGB32 image or draws through a
// borrowed context (e.g. a widget's draw context).
class CairoSurface : public Surface {
public:
    // Transparent image of the given size.
    CairoSurface(int width, int height);
    explicit CairoSurface(Cairo::RefPtr<Cairo::ImageSurface> image);
    CairoSurface(Cairo::RefPtr<Cairo::Context> context, int width, int height);

    // Throws std::runtime_error if the file can't be read as PNG.
    [[nodiscard]] static std::unique_ptr<CairoSurface> from_png(const std::string& path);

    [[nodiscard]] int width() const override { return width_; }
    [[nodiscard]] int height() const override { return height_; }

    void fill_rect(const Rect& r, Color color) override;
    void draw_rect(const Rect& r, Color fill, Color border) override;
    void draw_ellipse(const Rect& bounds, Color fill, Color border) override;
    void draw_polygon(const std::vector<Point>& points, Color fill, Color border) override;

    [[nodiscard]] Size text_extent(std::string_view text, const Font& font) const override;
    void draw_text(Point top_left, std::string_view text, const Font& font, Color color,
                   std::optional<Color> background) override;

    void blit(const Surface& src, const Rect& src_rect, Point dst) override;

    // Null for surfaces drawing through a borrowed context.
    [[nodiscard]] const Cairo::RefPtr<Cairo::ImageSurface>& image() const { return image_; }
    [[nodiscard]] const Cairo::RefPtr<Cairo::Context>& context() const { return cr_; }

    // Straight (non-premultiplied) RGBA rows, top to bottom.
    // Throws std::logic_error for surfaces without an image.
    [[nodiscard]] std::vector<uint8_t> to_rgba() const;

private:
    void set_color(Color color);
    void fill_and_stroke(Color fill, Color border);

    Cairo::RefPtr<Cairo::ImageSurface> image_;
    Cairo::RefPtr<Cairo::Context> cr_;
    int width_ = 0;
    int height_ = 0;
};

class CairoSurfaceFactory : public SurfaceFactory {
public:
    CairoSurfaceFactory();

    [[nodiscard]] std::unique_ptr<Surface> create(int width, int height) override;
    [[nodiscard]] Size text_extent(std::string_view text, const Font& font) const override;

private:
    // 1x1 scratch surface for text measurement
    std::unique_ptr<CairoSurface> measure_;
};

// Text metrics shared by surfaces and the factory.
[[nodiscard]] Size cairo_text_extent(const Cairo::RefPtr<Cairo::Context>& cr, std::string_view text,
                                     const Font& font);

} // namespace slippymap
