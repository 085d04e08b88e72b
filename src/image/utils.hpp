#pragma once

#include "image.hpp"
#include "lib.hpp"

#include <filesystem>
#include <fmt/format.h>
#include <fstream>
#include <span>
#include <stdexcept>
#include <vector>

#include <FreeImagePlus.h>

namespace Image {

template <typename... Args>
void Ensure(const bool cond, fmt::format_string<Args...> msg_fmt, Args &&... args) {
    if (!cond) {
        const auto msg = fmt::format(msg_fmt, std::forward<Args>(args)...);
        throw std::runtime_error(msg);
    }
}

inline std::vector<uint8_t> ReadFileData(const fs::path &path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        throw lib::FileError(path, "Failed to open file");
    }

    const std::streamsize size = file.tellg();
    if (size < 0) {
        throw lib::FileError(path, "Failed to determine file size");
    }
    file.seekg(0, std::ios::beg);

    std::vector<uint8_t> buffer(static_cast<size_t>(size));
    if (!file.read(reinterpret_cast<char *>(buffer.data()), size)) {
        throw lib::FileError(path, "Failed to read file");
    }
    return buffer;
}

inline std::vector<uint8_t> ReadFilePrefix(const fs::path &path, const size_t count) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw lib::FileError(path, "Failed to open file");
    }

    std::vector<uint8_t> buffer(count);
    file.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(count));
    if (file.bad()) {
        throw lib::FileError(path, "Failed to read file");
    }
    buffer.resize(static_cast<size_t>(file.gcount()));
    return buffer;
}

inline void WriteFileData(const fs::path &path, const std::span<const uint8_t> data) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw lib::FileError(path, "Failed to create file");
    }

    file.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!file) {
        throw lib::FileError(path, "Failed to write file");
    }
}

inline FREE_IMAGE_FORMAT ToFreeImageFormat(const Encoding encoding) {
    switch (encoding) {
    case Encoding::PNG:
        return FIF_PNG;
    case Encoding::JPEG:
        return FIF_JPEG;
    default:
        return FIF_UNKNOWN;
    }
}

// FreeImage keeps scanlines bottom-up; the channel order within a pixel follows FI_RGBA_*.
inline PixelGrid ToPixelGrid(fipImage &img) {
    // 32bpp bitmaps only come from colour modes with an alpha channel, even when fully opaque.
    const bool hasAlpha = img.isTransparent() || img.getBitsPerPixel() == 32;
    if (img.getImageType() != FIT_BITMAP || img.getBitsPerPixel() != 32) {
        Ensure(img.convertTo32Bits(), "Failed to convert image to 32bpp");
    }

    constexpr size_t channels = 4;
    PixelGrid grid;
    grid.Width = img.getWidth();
    grid.Height = img.getHeight();
    grid.HasAlpha = hasAlpha;
    grid.Pixels.resize(static_cast<size_t>(grid.Width) * grid.Height);

    for (uint32_t y = 0; y < grid.Height; ++y) {
        const BYTE *srcRow = img.getScanLine(grid.Height - 1 - y);
        for (uint32_t x = 0; x < grid.Width; ++x) {
            const BYTE *src = srcRow + x * channels;
            auto &dst = grid.At(x, y);
            dst.R = src[FI_RGBA_RED];
            dst.G = src[FI_RGBA_GREEN];
            dst.B = src[FI_RGBA_BLUE];
            dst.A = hasAlpha ? src[FI_RGBA_ALPHA] : 255;
        }
    }
    return grid;
}

inline fipImage ToFipImage(const PixelGrid &grid) {
    Ensure(grid.Pixels.size() == static_cast<size_t>(grid.Width) * grid.Height,
           "Pixel grid size mismatch ({}x{} with {} pixels)", grid.Width, grid.Height, grid.Pixels.size());

    const size_t channels = grid.HasAlpha ? 4 : 3;
    fipImage img(FIT_BITMAP, grid.Width, grid.Height, static_cast<unsigned>(channels * 8));
    Ensure(img.isValid(), "Failed to allocate {}x{} image", grid.Width, grid.Height);

    for (uint32_t y = 0; y < grid.Height; ++y) {
        BYTE *dstRow = img.getScanLine(grid.Height - 1 - y);
        for (uint32_t x = 0; x < grid.Width; ++x) {
            BYTE *dst = dstRow + x * channels;
            const auto &src = grid.At(x, y);
            dst[FI_RGBA_RED] = src.R;
            dst[FI_RGBA_GREEN] = src.G;
            dst[FI_RGBA_BLUE] = src.B;
            if (grid.HasAlpha) {
                dst[FI_RGBA_ALPHA] = src.A;
            }
        }
    }
    return img;
}

inline std::vector<uint8_t> SaveToMemory(const fipImage &img, const FREE_IMAGE_FORMAT fif, const int flags = 0) {
    fipMemoryIO memIO;
    Ensure(img.saveToMemory(fif, memIO, flags), "Failed to encode image ({}x{})", img.getWidth(), img.getHeight());

    BYTE *data = nullptr;
    DWORD size = 0;
    Ensure(memIO.acquire(&data, &size), "Failed to acquire encoded image memory");
    return std::vector<uint8_t>(data, data + size);
}

} // namespace Image
