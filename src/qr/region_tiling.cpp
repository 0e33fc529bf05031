#include <docscan/qr/region_tiling.hpp>
#include <algorithm>

namespace docscan::qr {

std::vector<TileRegion> fallback_regions(std::uint32_t width, std::uint32_t height) {
  const std::uint32_t region_width = width * 2 / 3;
  const std::uint32_t region_height = height * 2 / 3;
  const std::uint32_t step_x = width / 3;
  const std::uint32_t step_y = height / 3;

  std::vector<TileRegion> regions;
  regions.reserve(4);
  for (int row = 0; row < 2; ++row) {
    for (int col = 0; col < 2; ++col) {
      const std::uint32_t x = static_cast<std::uint32_t>(col) * step_x;
      const std::uint32_t y = static_cast<std::uint32_t>(row) * step_y;
      const std::uint32_t x2 = std::min(x + region_width, width);
      const std::uint32_t y2 = std::min(y + region_height, height);
      regions.push_back(TileRegion{{x, y, x2 - x, y2 - y}, row, col});
    }
  }
  return regions;
}

docscan::core::Point2 remap_to_frame(docscan::core::Point2 tile_point,
                                     float scale,
                                     const vision::PixelRect& region) noexcept {
  return docscan::core::Point2{
      tile_point.x / scale + static_cast<float>(region.x),
      tile_point.y / scale + static_cast<float>(region.y)};
}

}  // namespace docscan::qr
