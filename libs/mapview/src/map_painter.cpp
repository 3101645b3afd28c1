#include "slippymap/map_painter.h"

#include <format>
#include <optional>
#include <string>
#include <vector>

namespace slippymap {

Font label_font() {
    return Font{"Arial", 8.0, false};
}

void draw_tile_placeholder(Surface& target, const Tile& tile, Point top_left, Color background) {
    const Rect tile_rect = Rect::from_size(top_left, {kTileWidth, kTileHeight});
    target.draw_rect(tile_rect, background, colors::kDarkGray);

    const std::string text = std::format("Loading [{} : {}]...", tile.x, tile.y);
    const Font font = label_font();
    const Size extent = target.text_extent(text, font);
    const Point pos{tile_rect.left + (tile_rect.width() - extent.width) / 2,
                    tile_rect.top + (tile_rect.height() - extent.height) / 2};
    target.draw_text(pos, text, font, colors::kGreen, background);
}

std::unique_ptr<Surface> render_copyright(SurfaceFactory& factory, std::string_view text) {
    const Font font = label_font();
    const Size extent = factory.text_extent(text, font);
    auto label = factory.create(extent.width, extent.height);
    label->draw_text({0, 0}, text, font, colors::kGray, std::nullopt);
    return label;
}

std::unique_ptr<Surface> render_scale_bar(SurfaceFactory& factory, ZoomLevel zoom) {
    const ScaleBarParams params = scale_bar_params(zoom);
    const Font font = label_font();
    const Size text = factory.text_extent(params.text, font);
    const int letter_width = factory.text_extent("W", font).width;

    // text, space, bar
    const int width = letter_width + text.width + letter_width + params.width_px;
    const int height = 2 * kLabelMargin + text.height;
    auto label = factory.create(width, height);

    label->draw_rect({0, 0, width, height}, colors::kWhite, colors::kSilver);
    label->draw_text({letter_width / 2, kLabelMargin}, params.text, font, colors::kBlack, std::nullopt);

    Rect bar;
    bar.left = letter_width / 2 + text.width + letter_width;
    bar.top = (height - text.height / 2) / 2;
    bar.right = bar.left + params.width_px;
    bar.bottom = bar.top + text.height / 2;
    label->draw_rect(bar, colors::kWhite, colors::kBlack);
    return label;
}

Rect glyph_rect(Point center, int size) {
    return Rect::from_size({center.x - size / 2, center.y - size / 2}, {size, size});
}

void draw_glyph(Surface& target, const Rect& bounds, const GlyphStyle& style) {
    switch (style.shape) {
        case GlyphShape::Circle:
            target.draw_ellipse(bounds, style.bg_color, style.border_color);
            break;
        case GlyphShape::Square:
            target.draw_rect(bounds, style.bg_color, style.border_color);
            break;
        case GlyphShape::Triangle: {
            const std::vector<Point> points = {
                {bounds.left, bounds.bottom},
                {bounds.left + bounds.width() / 2, bounds.top},
                bounds.bottom_right(),
            };
            target.draw_polygon(points, style.bg_color, style.border_color);
            break;
        }
    }
}

void draw_caption(Surface& target, const Rect& glyph, std::string_view caption, const CaptionStyle& style,
                  const Font& font) {
    if (caption.empty()) return;
    const Point pos{glyph.right + style.dx, glyph.top + style.dy};
    std::optional<Color> background;
    if (!style.transparent) background = style.bg_color;
    target.draw_text(pos, caption, font, style.color, background);
}

} // namespace slippymap
