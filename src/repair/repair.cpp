#include "repair.hpp"
#include "image/utils.hpp"

#include <algorithm>
#include <cctype>
#include <spdlog/spdlog.h>

namespace {

std::string Lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](const unsigned char c) { return std::tolower(c); });
    return s;
}

bool Matches(const fs::directory_entry &entry, const std::string &extension) {
    return entry.is_regular_file() && Lower(entry.path().extension().string()) == Lower(extension);
}

void RemoveSidecar(const fs::path &path, const Repair::Options &opts) {
    auto sidecar = path;
    sidecar += opts.SidecarSuffix;
    if (!fs::exists(sidecar)) {
        return;
    }
    if (opts.DryRun) {
        spdlog::info("Would remove import file: {}", sidecar.string());
        return;
    }
    std::error_code ec;
    if (!fs::remove(sidecar, ec) || ec) {
        throw lib::FileError(sidecar, fmt::format("Failed to remove import file ({})", ec.message()));
    }
    spdlog::info("Removed import file: {}", sidecar.string());
}

} // namespace

Repair::FileResult Repair::ProcessBytes(const std::span<const uint8_t> bytes,
                                        const Image::BackgroundDetector &detector) {
    FileResult result;
    result.Sniffed = Image::Sniff(bytes);

    Image::PixelGrid grid;
    switch (result.Sniffed) {
    case Image::Encoding::JPEG: {
        result.Bytes = Image::EncodePng(Image::Decode(bytes, Image::Encoding::JPEG));
        result.Repaired = true;
        grid = Image::Decode(result.Bytes, Image::Encoding::PNG);
        break;
    }
    case Image::Encoding::PNG:
        grid = Image::Decode(bytes, Image::Encoding::PNG);
        break;
    default:
        return result;
    }

    if (grid.HasAlpha || !detector.Detect(grid).Removable) {
        return result;
    }

    const auto out = Image::RemoveBackground(grid, detector);
    if (out.Pixels == grid.Pixels) {
        // an all-opaque alpha grid would be written back as RGB and rewritten on every run
        return result;
    }
    result.Bytes = Image::EncodePng(out);
    result.MadeTransparent = true;
    return result;
}

bool Repair::ProcessFile(const fs::path &path, const Image::BackgroundDetector &detector, const Options &opts,
                         RunCounters &counters) {
    const auto data = Image::ReadFileData(path);

    FileResult result;
    try {
        result = ProcessBytes(data, detector);
    } catch (const std::exception &e) {
        throw lib::FileError(path, e.what());
    }

    if (result.Sniffed == Image::Encoding::UNKNOWN) {
        spdlog::debug("Skipping unrecognized content: {}", path.string());
        return false;
    }
    if (result.Repaired) {
        spdlog::info("Detected JPEG masked as {}: {}", opts.Extension, path.string());
    }
    if (!result.Changed()) {
        spdlog::debug("Unchanged: {}", path.string());
        return false;
    }

    if (opts.DryRun) {
        spdlog::info("Would rewrite: {}", path.string());
    } else {
        Image::WriteFileData(path, result.Bytes);
        if (result.Repaired) {
            spdlog::info("Converted to valid PNG: {}", path.string());
        }
        if (result.MadeTransparent) {
            spdlog::info("Removed white background: {}", path.string());
        }
    }
    RemoveSidecar(path, opts);

    if (result.Repaired) {
        ++counters.FilesRepaired;
    }
    if (result.MadeTransparent) {
        ++counters.FilesMadeTransparent;
    }
    return true;
}

Repair::RunCounters Repair::Run(const fs::path &root, const Image::BackgroundDetector &detector,
                                const Options &opts) {
    if (!fs::exists(root)) {
        throw lib::FileError(root, "Root directory does not exist");
    }
    if (!fs::is_directory(root)) {
        throw lib::FileError(root, "Root path is not a directory");
    }

    spdlog::info("Scanning {}...", root.string());

    // Collect first so rewrites never disturb the iteration.
    std::vector<fs::path> files;
    for (const auto &entry : fs::recursive_directory_iterator(root)) {
        if (Matches(entry, opts.Extension)) {
            files.push_back(entry.path());
        }
    }

    RunCounters counters;
    for (const auto &path : files) {
        ++counters.FilesScanned;
        spdlog::debug("Processing {}", path.string());
        try {
            ProcessFile(path, detector, opts, counters);
        } catch (const std::exception &e) {
            ++counters.FilesFailed;
            spdlog::error("Error processing {}: {}", path.string(), e.what());
        }
    }

    spdlog::info("Finished. Fixed {} corrupt files. Added transparency to {} files.", counters.FilesRepaired,
                 counters.FilesMadeTransparent);
    if (counters.FilesFailed > 0) {
        spdlog::warn("{} of {} files could not be processed", counters.FilesFailed, counters.FilesScanned);
    }
    return counters;
}

Repair::RunCounters Repair::Run(const fs::path &root, const Options &opts) {
    return Run(root, Image::CornerSampleDetector{}, opts);
}
