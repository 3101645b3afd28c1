#pragma once

#include "slippymap/mapmarks.h"
#include "slippymap/projection.h"
#include "slippymap/surface.h"

#include <memory>
#include <string_view>

// Stock drawing routines of the map view: tile placeholder, copyright and
// scale bar labels, mapmark glyphs and captions.
namespace slippymap {

// Gap between labels and the view border, and inside the scale bar frame.
constexpr int kLabelMargin = 2;

[[nodiscard]] Font label_font();

// "Loading [<x> : <y>]..." centered in a bordered tile rectangle.
void draw_tile_placeholder(Surface& target, const Tile& tile, Point top_left, Color background);

// Gray copyright text on a transparent bitmap sized to the text.
[[nodiscard]] std::unique_ptr<Surface> render_copyright(SurfaceFactory& factory, std::string_view text);

// Framed label with the scale text followed by the bar of the zoom's width.
[[nodiscard]] std::unique_ptr<Surface> render_scale_bar(SurfaceFactory& factory, ZoomLevel zoom);

// Square of `size` px centered on `center`.
[[nodiscard]] Rect glyph_rect(Point center, int size);

void draw_glyph(Surface& target, const Rect& bounds, const GlyphStyle& style);

// Caption left-aligned at the glyph's right edge, shifted by the style's dx/dy.
void draw_caption(Surface& target, const Rect& glyph, std::string_view caption, const CaptionStyle& style,
                  const Font& font);

} // namespace slippymap
