#pragma once

#include "lib.hpp"

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace Image {

enum class Encoding { UNKNOWN, PNG, JPEG };

std::string_view ToString(Encoding encoding);

struct Pixel {
    uint8_t R = 0;
    uint8_t G = 0;
    uint8_t B = 0;
    uint8_t A = 255;

    bool operator==(const Pixel &) const = default;
};

// Row-major, origin at the top-left corner.
struct PixelGrid {
    uint32_t Width = 0;
    uint32_t Height = 0;
    bool HasAlpha = false; // source colour mode carried transparency
    std::vector<Pixel> Pixels;

    [[nodiscard]] bool Empty() const {
        return Pixels.empty();
    }

    [[nodiscard]] const Pixel &At(const uint32_t x, const uint32_t y) const {
        return Pixels[static_cast<size_t>(y) * Width + x];
    }

    [[nodiscard]] Pixel &At(const uint32_t x, const uint32_t y) {
        return Pixels[static_cast<size_t>(y) * Width + x];
    }
};

void Initialize();

// Classifies the true encoding from the leading bytes; the extension is never consulted.
Encoding Sniff(std::span<const uint8_t> bytes);

Encoding SniffFile(const fs::path &path);

PixelGrid Decode(std::span<const uint8_t> bytes, Encoding encoding);

// Grids without alpha are written as 24-bit RGB. Alpha grids are written as RGBA unless every
// pixel is fully opaque, in which case FreeImage writes RGB and Decode() reports HasAlpha == false.
std::vector<uint8_t> EncodePng(const PixelGrid &grid);

bool IsMislabeled(const fs::path &path, Encoding encoding);

void EnsureValid(const fs::path &srcPath);

} // namespace Image
