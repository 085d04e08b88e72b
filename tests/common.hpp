#pragma once

#ifdef WIN32
#define _CRTDBG_MAP_ALLOC
#include <stdlib.h>
#include <crtdbg.h>
#define CATCH_CONFIG_WINDOWS_CRTDBG
#endif

#include <catch2/catch_all.hpp>
#include <filesystem>
#include <string>
#include <vector>

#include "image/image.hpp"
#include "image/utils.hpp"
#include "lib.hpp"
#include "tests/asset.h"

inline fs::path GetOutputPath(const std::wstring &filename = L"") {
    auto base = fs::path(TEST_OUTPUT_DIR);
    return filename.empty() ? base : base / filename;
}

// Fresh, empty directory under the scratch root.
inline fs::path MakeScratchDir(const std::wstring &name) {
    const auto dir = GetOutputPath(name);
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

inline void Setup() {
#ifdef WIN32
    _CrtSetDbgFlag(_CRTDBG_ALLOC_MEM_DF | _CRTDBG_LEAK_CHECK_DF);
#endif

    if (const fs::path tmp = GetOutputPath(); !fs::exists(tmp)) {
        fs::create_directories(tmp);
    }
}

constexpr Image::Pixel kWhite{255, 255, 255, 255};
constexpr Image::Pixel kDark{40, 40, 40, 255};

// Flat background with a centred square of foreground.
inline Image::PixelGrid MakeIcon(const uint32_t size, const Image::Pixel background, const Image::Pixel foreground,
                                 const bool hasAlpha = false) {
    Image::PixelGrid grid;
    grid.Width = size;
    grid.Height = size;
    grid.HasAlpha = hasAlpha;
    grid.Pixels.assign(static_cast<size_t>(size) * size, background);
    for (uint32_t y = size / 4 + size / 8; y < size - size / 4 - size / 8; ++y) {
        for (uint32_t x = size / 4 + size / 8; x < size - size / 4 - size / 8; ++x) {
            grid.At(x, y) = foreground;
        }
    }
    return grid;
}

inline std::vector<uint8_t> EncodeJpeg(const Image::PixelGrid &grid) {
    auto opaque = grid;
    opaque.HasAlpha = false;
    return Image::SaveToMemory(Image::ToFipImage(opaque), FIF_JPEG, JPEG_QUALITYSUPERB);
}

inline std::vector<uint8_t> EncodeGreyPng(const Image::PixelGrid &grid) {
    auto opaque = grid;
    opaque.HasAlpha = false;
    auto img = Image::ToFipImage(opaque);
    Image::Ensure(img.convertToGrayscale(), "Failed to convert fixture to greyscale");
    return Image::SaveToMemory(img, FIF_PNG, PNG_DEFAULT);
}

inline void WriteFile(const fs::path &path, const std::vector<uint8_t> &data) {
    Image::WriteFileData(path, data);
}

inline std::vector<uint8_t> ReadFile(const fs::path &path) {
    return Image::ReadFileData(path);
}

inline void Touch(const fs::path &path) {
    WriteFile(path, {'[', 'r', 'e', 'm', 'a', 'p', ']', '\n'});
}
