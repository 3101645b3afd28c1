#pragma once

#include <cstdint>
#include <filesystem>
#include <span>
#include <png.h>

// Row-by-row RGBA PNG writer on top of libpng.
class PngWriter {
public:
    PngWriter(const std::filesystem::path& path, int width, int height);
    ~PngWriter();

    PngWriter(const PngWriter&) = delete;
    PngWriter& operator=(const PngWriter&) = delete;

    void write_row(std::span<const uint8_t> row);
    // Whole image, rows top to bottom.
    void write_image(std::span<const uint8_t> rgba);
    void finish();

private:
    FILE* file_ = nullptr;
    png_structp png_ptr_ = nullptr;
    png_infop info_ptr_ = nullptr;
    int width_ = 0;
    int height_ = 0;
    int rows_written_ = 0;
    bool finished_ = false;
};
