#include "png_writer.h"

#include "slippymap/log.h"

#include <cstdio>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

namespace {
constexpr int kChannels = 4;
}

PngWriter::PngWriter(const fs::path& path, int width, int height)
    : width_(width), height_(height) {
    if (width <= 0 || height <= 0) {
        throw std::invalid_argument("png: invalid image size");
    }

    file_ = std::fopen(path.string().c_str(), "wb");
    if (!file_) {
        throw std::runtime_error("png: cannot open " + path.string());
    }

    png_ptr_ = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    if (!png_ptr_) {
        std::fclose(file_);
        throw std::runtime_error("png: png_create_write_struct failed");
    }

    info_ptr_ = png_create_info_struct(png_ptr_);
    if (!info_ptr_) {
        png_destroy_write_struct(&png_ptr_, nullptr);
        std::fclose(file_);
        throw std::runtime_error("png: png_create_info_struct failed");
    }

    if (setjmp(png_jmpbuf(png_ptr_))) {
        png_destroy_write_struct(&png_ptr_, &info_ptr_);
        std::fclose(file_);
        throw std::runtime_error("png: header write failed");
    }

    png_init_io(png_ptr_, file_);
    png_set_IHDR(png_ptr_, info_ptr_, width_, height_, 8, PNG_COLOR_TYPE_RGBA,
                 PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);
    png_write_info(png_ptr_, info_ptr_);
}

PngWriter::~PngWriter() {
    if (!finished_) LOGW("png: image closed before all rows were written");
    png_destroy_write_struct(&png_ptr_, &info_ptr_);
    if (file_) std::fclose(file_);
}

void PngWriter::write_row(std::span<const uint8_t> row) {
    if (row.size() != static_cast<size_t>(width_) * kChannels) {
        throw std::runtime_error("png: row size mismatch");
    }
    if (finished_ || rows_written_ >= height_) {
        throw std::runtime_error("png: too many rows");
    }
    if (setjmp(png_jmpbuf(png_ptr_))) {
        throw std::runtime_error("png: write row failed");
    }
    png_write_row(png_ptr_, const_cast<png_bytep>(row.data()));
    ++rows_written_;
}

void PngWriter::write_image(std::span<const uint8_t> rgba) {
    const size_t stride = static_cast<size_t>(width_) * kChannels;
    if (rgba.size() != stride * static_cast<size_t>(height_)) {
        throw std::runtime_error("png: image size mismatch");
    }
    for (int y = 0; y < height_; ++y)
        write_row(rgba.subspan(static_cast<size_t>(y) * stride, stride));
}

void PngWriter::finish() {
    if (finished_) return;
    if (rows_written_ != height_) {
        throw std::runtime_error("png: " + std::to_string(height_ - rows_written_) + " rows missing");
    }
    if (setjmp(png_jmpbuf(png_ptr_))) {
        throw std::runtime_error("png: write end failed");
    }
    png_write_end(png_ptr_, info_ptr_);
    finished_ = true;
}
