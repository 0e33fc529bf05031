#include <docscan/mrz/mrz_region.hpp>
#include <docscan/vision/grayscale_stage.hpp>
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <numeric>
#include <vector>

namespace docscan::mrz {

namespace dc = docscan::core;

namespace {

constexpr std::uint8_t kDarkThreshold = 128;
constexpr double kDensityFactor = 1.5;
constexpr double kTopExclusion = 0.3;
constexpr std::uint32_t kMaxRowGap = 5;
constexpr std::uint32_t kMinBandHeight = 20;
constexpr std::uint32_t kBandPadding = 10;
constexpr float kOcrContrast = 2.0f;
constexpr float kOcrBrightness = 10.f;

struct Band {
  std::uint32_t start;
  std::uint32_t end;
};

}  // namespace

std::expected<dc::Frame, dc::Error> preprocess_for_ocr(const dc::Frame& input) {
  auto gray = vision::to_grayscale(input);
  if (!gray) return gray;

  auto sharp = vision::sharpen(*gray);
  if (!sharp) return sharp;

  auto contrasted = vision::adjust_contrast(*sharp, kOcrContrast, kOcrBrightness);
  if (!contrasted) return contrasted;

  return vision::otsu_threshold(*contrasted);
}

std::optional<vision::PixelRect> locate_mrz_region(const dc::Frame& binary) {
  if (binary.empty() || binary.format() != dc::PixelFormat::Grayscale8 ||
      binary.size_bytes() !=
          dc::Frame::expected_bytes(binary.width(), binary.height(), binary.format())) {
    return std::nullopt;
  }

  const std::uint32_t width = binary.width();
  const std::uint32_t height = binary.height();

  std::vector<std::size_t> projection(height, 0);
  for (std::uint32_t y = 0; y < height; ++y) {
    for (std::uint32_t x = 0; x < width; ++x) {
      if (binary.luma_at(x, y) < kDarkThreshold) ++projection[y];
    }
  }

  const double mean =
      static_cast<double>(std::accumulate(projection.begin(), projection.end(), std::size_t{0})) /
      static_cast<double>(height);
  const double threshold = mean * kDensityFactor;
  const auto first_row = static_cast<std::uint32_t>(static_cast<double>(height) * kTopExclusion);

  std::vector<std::uint32_t> rows;
  for (std::uint32_t y = first_row; y < height; ++y) {
    if (static_cast<double>(projection[y]) > threshold) rows.push_back(y);
  }
  if (rows.empty()) return std::nullopt;

  std::vector<Band> bands;
  Band current{rows.front(), rows.front()};
  for (std::size_t i = 1; i < rows.size(); ++i) {
    if (rows[i] - current.end <= kMaxRowGap) {
      current.end = rows[i];
      continue;
    }
    if (current.end - current.start >= kMinBandHeight) bands.push_back(current);
    current = Band{rows[i], rows[i]};
  }
  if (current.end - current.start >= kMinBandHeight) bands.push_back(current);
  if (bands.empty()) return std::nullopt;

  const Band& mrz = bands.back();
  const std::uint32_t y1 = mrz.start > kBandPadding ? mrz.start - kBandPadding : 0;
  const std::uint32_t y2 = std::min(height, mrz.end + kBandPadding);
  return vision::PixelRect{0, y1, width, y2 - y1};
}

std::expected<dc::Frame, dc::Error> extract_mrz_zone(const dc::Frame& binary,
                                                     const vision::PixelRect& region,
                                                     float scale) {
  auto zone = vision::crop(binary, region);
  if (!zone) return zone;
  return vision::upscale(*zone, scale);
}

}  // namespace docscan::mrz
