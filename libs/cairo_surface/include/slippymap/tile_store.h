#pragma once

#include "slippymap/projection.h"
#include "slippymap/surface.h"

#include <filesystem>

namespace slippymap {

// Tile images on disk laid out as <root>/<zoom>/<x>/<y>.png.
class LocalTileStore {
public:
    explicit LocalTileStore(std::filesystem::path root);

    [[nodiscard]] const std::filesystem::path& root() const { return root_; }
    [[nodiscard]] std::filesystem::path tile_path(const Tile& tile) const;
    [[nodiscard]] bool has_tile(const Tile& tile) const;

    // Draws `tile` at `top_left` on a cairo `target`. Returns false when the
    // tile is missing or unreadable so the caller can fall back to a placeholder.
    bool draw(const Tile& tile, Point top_left, Surface& target) const;

private:
    std::filesystem::path root_;
};

} // namespace slippymap
