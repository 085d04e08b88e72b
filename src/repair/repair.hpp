#pragma once

#include "image/background.hpp"
#include "lib.hpp"

#include <string>

namespace Repair {

struct Options {
    std::string Extension = ".png";
    std::string SidecarSuffix = ".import";
    bool DryRun = false;
};

struct RunCounters {
    size_t FilesScanned = 0;
    size_t FilesRepaired = 0;
    size_t FilesMadeTransparent = 0;
    size_t FilesFailed = 0;
};

// Outcome of processing one file; nothing has been written yet.
struct FileResult {
    Image::Encoding Sniffed = Image::Encoding::UNKNOWN;
    bool Repaired = false;
    bool MadeTransparent = false;
    std::vector<uint8_t> Bytes;

    [[nodiscard]] bool Changed() const {
        return Repaired || MadeTransparent;
    }
};

// Pure stage: bytes in, canonical bytes out. Throws on decode/encode failure.
FileResult ProcessBytes(std::span<const uint8_t> bytes, const Image::BackgroundDetector &detector);

bool ProcessFile(const fs::path &path, const Image::BackgroundDetector &detector, const Options &opts,
                 RunCounters &counters);

RunCounters Run(const fs::path &root, const Image::BackgroundDetector &detector, const Options &opts = {});

RunCounters Run(const fs::path &root, const Options &opts = {});

} // namespace Repair
