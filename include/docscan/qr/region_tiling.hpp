#pragma once

#include <docscan/core/qr_detection.hpp>
#include <docscan/vision/image_ops.hpp>
#include <array>
#include <cstdint>
#include <vector>

namespace docscan::qr {

/// Frames smaller than this in either dimension skip the region fallback.
inline constexpr std::uint32_t kFallbackMinDimension = 400;

/// Upscale factors tried per region, in order.
inline constexpr std::array<float, 3> kFallbackScales{1.5f, 2.0f, 2.5f};

/// One fallback region: its rectangle in frame space and grid position.
struct TileRegion {
  vision::PixelRect rect{};
  int row{0};
  int col{0};
};

/// 2x2 overlapping regions in row-major order: (0,0), (0,1), (1,0), (1,1).
/// Region size is floor(2/3) of each dimension, step floor(1/3); regions are
/// clipped to the frame.
[[nodiscard]] std::vector<TileRegion> fallback_regions(std::uint32_t width,
                                                       std::uint32_t height);

/// Map a point from an upscaled tile back to frame space:
/// tile / scale + region origin.
[[nodiscard]] docscan::core::Point2 remap_to_frame(docscan::core::Point2 tile_point,
                                                   float scale,
                                                   const vision::PixelRect& region) noexcept;

}  // namespace docscan::qr
