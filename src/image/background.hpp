#pragma once

#include "image.hpp"

#include <cstdint>

namespace Image {

constexpr uint8_t kWhiteThreshold = 240;

struct BackgroundVerdict {
    bool Removable = false;
    Pixel Reference{};
};

class BackgroundDetector {
public:
    virtual ~BackgroundDetector() = default;

    [[nodiscard]] virtual BackgroundVerdict Detect(const PixelGrid &grid) const = 0;

    // Per-pixel rule used by RemoveBackground once Detect() has accepted the image.
    [[nodiscard]] virtual bool IsBackground(const Pixel &pixel) const = 0;
};

// Samples the top-left pixel only. Suited to flat-background icon renders where
// the corner is always background; anything else needs a different detector.
class CornerSampleDetector final : public BackgroundDetector {
public:
    explicit CornerSampleDetector(uint8_t threshold = kWhiteThreshold) : m_threshold(threshold) {}

    [[nodiscard]] BackgroundVerdict Detect(const PixelGrid &grid) const override;

    [[nodiscard]] bool IsBackground(const Pixel &pixel) const override;

    [[nodiscard]] uint8_t Threshold() const {
        return m_threshold;
    }

private:
    uint8_t m_threshold;
};

// Background pixels become (255,255,255,0); all others pass through untouched.
PixelGrid RemoveBackground(const PixelGrid &grid, const BackgroundDetector &detector);

} // namespace Image
