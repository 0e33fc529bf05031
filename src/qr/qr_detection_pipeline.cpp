#include <docscan/qr/qr_detection_pipeline.hpp>
#include <docscan/vision/image_ops.hpp>
#include <string>
#include <unordered_set>
#include <utility>

namespace docscan::qr {

namespace dc = docscan::core;

QrDetectionPipeline::QrDetectionPipeline(std::unique_ptr<IQrDecoder> decoder,
                                         QrDetectionOptions options,
                                         dc::ScanObserver observer)
    : decoder_(std::move(decoder)),
      options_(std::move(options)),
      observer_(std::move(observer)) {}

std::vector<dc::QrDetection> QrDetectionPipeline::detect(const dc::Frame& gray) {
  return scan(gray).detections;
}

dc::QrScanResult QrDetectionPipeline::scan(const dc::Frame& gray) {
  dc::QrScanResult result;
  if (!decoder_ || gray.empty() || gray.format() != dc::PixelFormat::Grayscale8) {
    return result;
  }

  result.detections = decode_grids(gray, 1.f, vision::PixelRect{}, -1, -1);
  dc::notify(observer_, {dc::ScanEventKind::StandardPassDone, result.detections.size()});
  if (!result.detections.empty()) {
    result.pass = dc::ScanPass::Standard;
    return result;
  }

  result.detections = scan_regions(gray);
  if (!result.detections.empty()) {
    result.pass = dc::ScanPass::Fallback;
  }
  return result;
}

std::vector<dc::QrDetection> QrDetectionPipeline::decode_grids(
    const dc::Frame& image,
    float scale,
    const vision::PixelRect& region,
    int row,
    int col) {
  std::vector<dc::QrDetection> out;
  for (const QrGrid& grid : decoder_->detect_grids(image)) {
    auto symbol = decoder_->decode(image, grid);
    if (!symbol) {
      dc::notify(observer_, {dc::ScanEventKind::GridDecodeFailed, 0, row, col, scale, {}});
      continue;
    }

    dc::QrDetection d;
    d.payload = std::move(symbol->payload);
    d.version = symbol->version;
    for (std::size_t i = 0; i < grid.bounds.size(); ++i) {
      d.bounds[i] = remap_to_frame(grid.bounds[i], scale, region);
    }
    out.push_back(std::move(d));
  }
  return out;
}

std::vector<dc::QrDetection> QrDetectionPipeline::scan_regions(const dc::Frame& gray) {
  std::vector<dc::QrDetection> found;

  const std::uint32_t min_dim = options_.fallback_min_dimension;
  if (!options_.fallback_enabled || gray.width() < min_dim || gray.height() < min_dim) {
    dc::notify(observer_, {dc::ScanEventKind::FallbackSkipped});
    return found;
  }
  dc::notify(observer_, {dc::ScanEventKind::FallbackStarted});

  std::unordered_set<std::string> seen;
  for (const TileRegion& region : fallback_regions(gray.width(), gray.height())) {
    auto tile = vision::crop(gray, region.rect);
    if (!tile) continue;

    for (const float scale : options_.fallback_scales) {
      auto upscaled = vision::upscale(*tile, scale);
      if (!upscaled) continue;

      std::size_t added = 0;
      for (auto& d : decode_grids(*upscaled, scale, region.rect, region.row, region.col)) {
        if (seen.insert(d.payload).second) {
          found.push_back(std::move(d));
          ++added;
        }
      }
      dc::notify(observer_,
                 {dc::ScanEventKind::TileScanned, added, region.row, region.col, scale, {}});

      if (options_.policy == FallbackPolicy::StopAtFirstMatch && !found.empty()) {
        dc::notify(observer_, {dc::ScanEventKind::FallbackDone, found.size()});
        return found;
      }
    }
  }

  dc::notify(observer_, {dc::ScanEventKind::FallbackDone, found.size()});
  return found;
}

}  // namespace docscan::qr
