#include "background.hpp"

#include <algorithm>

namespace Image {

BackgroundVerdict CornerSampleDetector::Detect(const PixelGrid &grid) const {
    if (grid.Empty()) {
        return {};
    }
    const auto &corner = grid.At(0, 0);
    return {IsBackground(corner), corner};
}

bool CornerSampleDetector::IsBackground(const Pixel &pixel) const {
    // strictly greater: a channel at exactly the threshold is foreground
    return pixel.R > m_threshold && pixel.G > m_threshold && pixel.B > m_threshold;
}

PixelGrid RemoveBackground(const PixelGrid &grid, const BackgroundDetector &detector) {
    constexpr Pixel transparent{255, 255, 255, 0};

    PixelGrid out;
    out.Width = grid.Width;
    out.Height = grid.Height;
    out.HasAlpha = true;
    out.Pixels.resize(grid.Pixels.size());

    std::transform(grid.Pixels.begin(), grid.Pixels.end(), out.Pixels.begin(), [&](const Pixel &px) {
        return detector.IsBackground(px) ? transparent : px;
    });
    return out;
}

} // namespace Image
