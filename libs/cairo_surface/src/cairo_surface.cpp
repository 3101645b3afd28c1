#include "slippymap/cairo_surface.h"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <numbers>
#include <stdexcept>
#include <utility>

namespace slippymap {

namespace {

// Font sizes are in points; cairo works in device pixels at 96 dpi.
constexpr double kPixelsPerPoint = 96.0 / 72.0;

void select_font(const Cairo::RefPtr<Cairo::Context>& cr, const Font& font) {
    cr->select_font_face(font.family, Cairo::ToyFontFace::Slant::NORMAL,
                         font.bold ? Cairo::ToyFontFace::Weight::BOLD
                                   : Cairo::ToyFontFace::Weight::NORMAL);
    cr->set_font_size(font.size * kPixelsPerPoint);
}

} // namespace

Size cairo_text_extent(const Cairo::RefPtr<Cairo::Context>& cr, std::string_view text, const Font& font) {
    cr->save();
    select_font(cr, font);
    Cairo::TextExtents ext;
    cr->get_text_extents(std::string(text), ext);
    Cairo::FontExtents fext;
    cr->get_font_extents(fext);
    cr->restore();
    return {static_cast<int>(std::ceil(ext.x_advance)),
            static_cast<int>(std::ceil(fext.ascent + fext.descent))};
}

CairoSurface::CairoSurface(int width, int height)
    : CairoSurface(Cairo::ImageSurface::create(Cairo::Surface::Format::ARGB32, width, height)) {}

CairoSurface::CairoSurface(Cairo::RefPtr<Cairo::ImageSurface> image)
    : image_(std::move(image)) {
    if (!image_) throw std::invalid_argument("CairoSurface: null image");
    cr_ = Cairo::Context::create(image_);
    width_ = image_->get_width();
    height_ = image_->get_height();
}

CairoSurface::CairoSurface(Cairo::RefPtr<Cairo::Context> context, int width, int height)
    : cr_(std::move(context)), width_(width), height_(height) {
    if (!cr_) throw std::invalid_argument("CairoSurface: null context");
}

std::unique_ptr<CairoSurface> CairoSurface::from_png(const std::string& path) {
    if (!std::filesystem::exists(path))
        throw std::runtime_error("CairoSurface: no such file " + path);
    Cairo::RefPtr<Cairo::ImageSurface> image;
    try {
        image = Cairo::ImageSurface::create_from_png(path);
    } catch (const std::exception& e) {
        throw std::runtime_error("CairoSurface: cannot read " + path + ": " + e.what());
    }
    return std::make_unique<CairoSurface>(std::move(image));
}

void CairoSurface::set_color(Color color) {
    cr_->set_source_rgba(color.r / 255.0, color.g / 255.0, color.b / 255.0, color.a / 255.0);
}

void CairoSurface::fill_and_stroke(Color fill, Color border) {
    set_color(fill);
    cr_->fill_preserve();
    set_color(border);
    cr_->set_line_width(1.0);
    cr_->stroke();
}

void CairoSurface::fill_rect(const Rect& r, Color color) {
    if (r.empty()) return;
    cr_->save();
    cr_->set_operator(Cairo::Context::Operator::SOURCE);
    set_color(color);
    cr_->rectangle(r.left, r.top, r.width(), r.height());
    cr_->fill();
    cr_->restore();
}

void CairoSurface::draw_rect(const Rect& r, Color fill, Color border) {
    if (r.empty()) return;
    // Half-pixel inset keeps the one pixel border inside the rect
    cr_->rectangle(r.left + 0.5, r.top + 0.5, r.width() - 1.0, r.height() - 1.0);
    fill_and_stroke(fill, border);
}

void CairoSurface::draw_ellipse(const Rect& bounds, Color fill, Color border) {
    if (bounds.empty()) return;
    const double rx = (bounds.width() - 1.0) / 2.0;
    const double ry = (bounds.height() - 1.0) / 2.0;
    cr_->save();
    cr_->translate(bounds.left + 0.5 + rx, bounds.top + 0.5 + ry);
    cr_->scale(std::max(rx, 0.5), std::max(ry, 0.5));
    cr_->arc(0.0, 0.0, 1.0, 0.0, 2.0 * std::numbers::pi);
    cr_->restore();
    fill_and_stroke(fill, border);
}

void CairoSurface::draw_polygon(const std::vector<Point>& points, Color fill, Color border) {
    if (points.size() < 2) return;
    cr_->move_to(points.front().x + 0.5, points.front().y + 0.5);
    for (size_t i = 1; i < points.size(); ++i)
        cr_->line_to(points[i].x + 0.5, points[i].y + 0.5);
    cr_->close_path();
    fill_and_stroke(fill, border);
}

Size CairoSurface::text_extent(std::string_view text, const Font& font) const {
    return cairo_text_extent(cr_, text, font);
}

void CairoSurface::draw_text(Point top_left, std::string_view text, const Font& font, Color color,
                             std::optional<Color> background) {
    if (background) fill_rect(Rect::from_size(top_left, text_extent(text, font)), *background);

    cr_->save();
    select_font(cr_, font);
    Cairo::FontExtents fext;
    cr_->get_font_extents(fext);
    set_color(color);
    cr_->move_to(top_left.x, top_left.y + fext.ascent);
    cr_->show_text(std::string(text));
    cr_->restore();
}

void CairoSurface::blit(const Surface& src, const Rect& src_rect, Point dst) {
    const auto* source = dynamic_cast<const CairoSurface*>(&src);
    if (!source || !source->image_)
        throw std::invalid_argument("CairoSurface::blit: source is not a cairo image surface");
    if (src_rect.empty()) return;

    source->image_->flush();
    cr_->save();
    cr_->set_source(source->image_, dst.x - src_rect.left, dst.y - src_rect.top);
    cr_->rectangle(dst.x, dst.y, src_rect.width(), src_rect.height());
    cr_->fill();
    cr_->restore();
}

std::vector<uint8_t> CairoSurface::to_rgba() const {
    if (!image_) throw std::logic_error("CairoSurface::to_rgba: surface has no image");
    image_->flush();

    const unsigned char* data = image_->get_data();
    const int stride = image_->get_stride();
    std::vector<uint8_t> rgba(static_cast<size_t>(width_) * height_ * 4);

    // ARGB32 is premultiplied, one native-endian uint32 per pixel
    for (int y = 0; y < height_; ++y) {
        const auto* row = reinterpret_cast<const uint32_t*>(data + static_cast<size_t>(y) * stride);
        uint8_t* out = rgba.data() + static_cast<size_t>(y) * width_ * 4;
        for (int x = 0; x < width_; ++x) {
            const uint32_t px = row[x];
            const uint32_t a = px >> 24;
            uint32_t r = (px >> 16) & 0xff;
            uint32_t g = (px >> 8) & 0xff;
            uint32_t b = px & 0xff;
            if (a != 0 && a != 255) {
                r = std::min<uint32_t>(255, (r * 255 + a / 2) / a);
                g = std::min<uint32_t>(255, (g * 255 + a / 2) / a);
                b = std::min<uint32_t>(255, (b * 255 + a / 2) / a);
            }
            out[x * 4 + 0] = static_cast<uint8_t>(r);
            out[x * 4 + 1] = static_cast<uint8_t>(g);
            out[x * 4 + 2] = static_cast<uint8_t>(b);
            out[x * 4 + 3] = static_cast<uint8_t>(a);
        }
    }
    return rgba;
}

CairoSurfaceFactory::CairoSurfaceFactory()
    : measure_(std::make_unique<CairoSurface>(1, 1)) {}

std::unique_ptr<Surface> CairoSurfaceFactory::create(int width, int height) {
    return std::make_unique<CairoSurface>(std::max(width, 1), std::max(height, 1));
}

Size CairoSurfaceFactory::text_extent(std::string_view text, const Font& font) const {
    return measure_->text_extent(text, font);
}

} // namespace slippymap
