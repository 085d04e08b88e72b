#include "image.hpp"
#include "lib.hpp"
#include "utils.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <spdlog/spdlog.h>

namespace {
constexpr std::array<uint8_t, 3> kJpegMagic = {0xFF, 0xD8, 0xFF};
constexpr std::array<uint8_t, 4> kPngMagic = {0x89, 0x50, 0x4E, 0x47};
constexpr size_t kSniffLength = 4;

bool StartsWith(const std::span<const uint8_t> bytes, const std::span<const uint8_t> magic) {
    return bytes.size() >= magic.size() && std::equal(magic.begin(), magic.end(), bytes.begin());
}
} // namespace

void Image::Initialize() {
    FreeImage_Initialise();
    FreeImage_SetOutputMessage([](FREE_IMAGE_FORMAT, const char *msg) {
        spdlog::error(msg);
    });
}

std::string_view Image::ToString(const Encoding encoding) {
    switch (encoding) {
    case Encoding::PNG:
        return "PNG";
    case Encoding::JPEG:
        return "JPEG";
    default:
        return "UNKNOWN";
    }
}

Image::Encoding Image::Sniff(const std::span<const uint8_t> bytes) {
    const auto head = bytes.first((std::min)(bytes.size(), kSniffLength));
    if (StartsWith(head, kJpegMagic)) {
        return Encoding::JPEG;
    }
    if (StartsWith(head, kPngMagic)) {
        return Encoding::PNG;
    }
    return Encoding::UNKNOWN;
}

Image::Encoding Image::SniffFile(const fs::path &path) {
    return Sniff(ReadFilePrefix(path, kSniffLength));
}

Image::PixelGrid Image::Decode(const std::span<const uint8_t> bytes, const Encoding encoding) {
    const auto fif = ToFreeImageFormat(encoding);
    Ensure(fif != FIF_UNKNOWN, "Cannot decode {} data", ToString(encoding));
    Ensure(!bytes.empty(), "Cannot decode empty {} data", ToString(encoding));

    fipMemoryIO memIO(const_cast<BYTE *>(bytes.data()), static_cast<DWORD>(bytes.size()));
    fipImage img;
    img = memIO.load(fif, encoding == Encoding::JPEG ? JPEG_ACCURATE : PNG_DEFAULT);
    Ensure(img.isValid(), "Failed to decode {} data ({} bytes)", ToString(encoding), bytes.size());
    return ToPixelGrid(img);
}

std::vector<uint8_t> Image::EncodePng(const PixelGrid &grid) {
    return SaveToMemory(ToFipImage(grid), FIF_PNG, PNG_DEFAULT);
}

bool Image::IsMislabeled(const fs::path &path, const Encoding encoding) {
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](const unsigned char c) { return std::tolower(c); });
    switch (encoding) {
    case Encoding::PNG:
        return ext != ".png";
    case Encoding::JPEG:
        return ext != ".jpg" && ext != ".jpeg";
    default:
        return true;
    }
}

void Image::EnsureValid(const fs::path &srcPath) {
    const auto data = ReadFileData(srcPath);
    const auto encoding = Sniff(data);
    if (encoding == Encoding::UNKNOWN) {
        throw lib::FileError(srcPath, "Unrecognized image encoding");
    }

    PixelGrid grid;
    try {
        grid = Decode(data, encoding);
    } catch (const std::exception &e) {
        throw lib::FileError(srcPath, e.what());
    }

    spdlog::info("{}: {} {}x{} ({})", srcPath.string(), ToString(encoding), grid.Width, grid.Height,
                 grid.HasAlpha ? "alpha" : "opaque");
    if (IsMislabeled(srcPath, encoding)) {
        spdlog::warn("{}: extension does not match {} content", srcPath.string(), ToString(encoding));
    }
}
