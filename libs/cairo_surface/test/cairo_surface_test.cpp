#include "slippymap/cairo_surface.h"
#include "slippymap/tile_store.h"

#include "recording_surface.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace slippymap;
using slippymap::testing::RecordingSurface;

namespace {

struct Rgba {
    int r, g, b, a;
};

Rgba pixel(const std::vector<uint8_t>& rgba, int width, int x, int y) {
    const size_t i = (static_cast<size_t>(y) * width + x) * 4;
    return {rgba[i], rgba[i + 1], rgba[i + 2], rgba[i + 3]};
}

} // namespace

TEST(CairoSurface, NewSurfaceIsTransparent) {
    CairoSurfaceFactory factory;
    auto surface = factory.create(8, 4);
    ASSERT_EQ(surface->size(), (Size{8, 4}));

    const auto rgba = static_cast<CairoSurface&>(*surface).to_rgba();
    ASSERT_EQ(rgba.size(), 8u * 4u * 4u);
    for (uint8_t v : rgba) EXPECT_EQ(v, 0);
}

TEST(CairoSurface, FillRectCoversHalfOpenRect) {
    CairoSurface surface(6, 6);
    surface.fill_rect({1, 1, 4, 3}, Color{255, 0, 0});

    const auto rgba = surface.to_rgba();
    const Rgba inside = pixel(rgba, 6, 3, 2);
    EXPECT_EQ(inside.r, 255);
    EXPECT_EQ(inside.g, 0);
    EXPECT_EQ(inside.a, 255);
    EXPECT_EQ(pixel(rgba, 6, 4, 2).a, 0);
    EXPECT_EQ(pixel(rgba, 6, 3, 3).a, 0);
    EXPECT_EQ(pixel(rgba, 6, 0, 0).a, 0);
}

TEST(CairoSurface, FillRectReplacesWithTransparent) {
    CairoSurface surface(4, 4);
    surface.fill_rect({0, 0, 4, 4}, colors::kWhite);
    surface.fill_rect({0, 0, 2, 2}, colors::kTransparent);

    const auto rgba = surface.to_rgba();
    EXPECT_EQ(pixel(rgba, 4, 1, 1).a, 0);
    EXPECT_EQ(pixel(rgba, 4, 3, 3).a, 255);
}

TEST(CairoSurface, DrawRectBorderStaysInside) {
    CairoSurface surface(10, 10);
    surface.draw_rect({2, 2, 8, 8}, colors::kWhite, colors::kBlack);

    const auto rgba = surface.to_rgba();
    const Rgba corner = pixel(rgba, 10, 2, 2);
    EXPECT_EQ(corner.r, 0);
    EXPECT_EQ(corner.a, 255);
    const Rgba last = pixel(rgba, 10, 7, 7);
    EXPECT_EQ(last.r, 0);
    EXPECT_EQ(last.a, 255);
    const Rgba center = pixel(rgba, 10, 5, 5);
    EXPECT_EQ(center.r, 255);
    EXPECT_EQ(pixel(rgba, 10, 8, 8).a, 0);
}

TEST(CairoSurface, BlitCopiesSourceRect) {
    CairoSurface src(8, 8);
    src.fill_rect({4, 4, 8, 8}, Color{0, 0, 255});

    CairoSurface dst(4, 4);
    dst.blit(src, {4, 4, 6, 6}, {1, 1});

    const auto rgba = dst.to_rgba();
    const Rgba copied = pixel(rgba, 4, 2, 2);
    EXPECT_EQ(copied.b, 255);
    EXPECT_EQ(copied.a, 255);
    EXPECT_EQ(pixel(rgba, 4, 3, 3).a, 0);
    EXPECT_EQ(pixel(rgba, 4, 0, 0).a, 0);
}

TEST(CairoSurface, BlitRejectsForeignSurface) {
    CairoSurface dst(4, 4);
    RecordingSurface foreign(4, 4);
    EXPECT_THROW(dst.blit(foreign, {0, 0, 4, 4}, {0, 0}), std::invalid_argument);
}

TEST(CairoSurface, TextExtentGrowsWithText) {
    CairoSurfaceFactory factory;
    const Font font;
    const Size one = factory.text_extent("W", font);
    const Size many = factory.text_extent("WWWWWWWW", font);
    EXPECT_GT(one.width, 0);
    EXPECT_GT(one.height, 0);
    EXPECT_GT(many.width, one.width);
    EXPECT_EQ(many.height, one.height);
    EXPECT_EQ(factory.text_extent("", font).width, 0);
}

TEST(CairoSurface, DrawTextPaintsBackground) {
    CairoSurface surface(64, 32);
    const Font font;
    const Size ext = surface.text_extent("ab", font);
    surface.draw_text({0, 0}, "ab", font, colors::kBlack, colors::kWhite);

    const auto rgba = surface.to_rgba();
    EXPECT_EQ(pixel(rgba, 64, 0, 0).a, 255);
    EXPECT_EQ(pixel(rgba, 64, ext.width + 1, 0).a, 0);
}

TEST(CairoSurface, FromPngMissingFileThrows) {
    EXPECT_THROW((void)CairoSurface::from_png("/nonexistent/slippymap/tile.png"), std::runtime_error);
}

TEST(LocalTileStore, TilePathLayout) {
    const LocalTileStore store("/srv/tiles");
    EXPECT_EQ(store.tile_path(Tile{5, 17, 10}), std::filesystem::path("/srv/tiles/5/17/10.png"));
}

TEST(LocalTileStore, DrawsStoredTileAndReportsMissing) {
    namespace fs = std::filesystem;
    const fs::path root = fs::temp_directory_path() / "slippymap_tile_store";
    fs::remove_all(root);
    fs::create_directories(root / "1" / "0");

    CairoSurface tile(kTileWidth, kTileHeight);
    tile.fill_rect({0, 0, kTileWidth, kTileHeight}, Color{0, 255, 0});
    tile.image()->write_to_png((root / "1" / "0" / "1.png").string());
    {
        std::ofstream broken(root / "1" / "0" / "0.png");
        broken << "not a png";
    }

    const LocalTileStore store(root);
    CairoSurface target(512, 512);
    EXPECT_TRUE(store.has_tile(Tile{1, 0, 1}));
    EXPECT_TRUE(store.draw(Tile{1, 0, 1}, {0, 256}, target));
    EXPECT_FALSE(store.draw(Tile{1, 1, 1}, {256, 256}, target));
    EXPECT_FALSE(store.draw(Tile{1, 0, 0}, {0, 0}, target));

    const auto rgba = target.to_rgba();
    const Rgba drawn = pixel(rgba, 512, 10, 300);
    EXPECT_EQ(drawn.g, 255);
    EXPECT_EQ(drawn.a, 255);
    EXPECT_EQ(pixel(rgba, 512, 300, 300).a, 0);
    EXPECT_EQ(pixel(rgba, 512, 10, 10).a, 0);

    fs::remove_all(root);
}
