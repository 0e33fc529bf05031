#pragma once

#include <docscan/core/frame.hpp>
#include <docscan/core/qr_detection.hpp>
#include <docscan/core/scan_observer.hpp>
#include <docscan/qr/qr_decoder.hpp>
#include <docscan/qr/region_tiling.hpp>
#include <cstdint>
#include <memory>
#include <vector>

namespace docscan::qr {

/// How far the region fallback scans once something has been decoded.
enum class FallbackPolicy : std::uint8_t {
  StopAtFirstMatch,  // return after the first (region, scale) step with a hit
  Exhaustive,        // scan every region and scale, dedupe by payload
};

struct QrDetectionOptions {
  bool fallback_enabled{true};
  FallbackPolicy policy{FallbackPolicy::StopAtFirstMatch};
  std::uint32_t fallback_min_dimension{kFallbackMinDimension};
  std::vector<float> fallback_scales =
      std::vector<float>(kFallbackScales.begin(), kFallbackScales.end());
};

/// Two-pass QR detection over a Grayscale8 frame.
///
/// Standard pass: one detect+decode over the full frame; grids that fail to
/// decode are skipped. Fallback (only when the standard pass found nothing):
/// fallback_regions() x fallback_scales, each tile Lanczos-upscaled and scanned,
/// bounds remapped to frame space, results deduplicated by payload.
///
/// Never fails: anything that goes wrong past the input check reads as "no codes".
/// Owns its decoder; not thread-safe. Use one instance per thread.
class QrDetectionPipeline {
 public:
  explicit QrDetectionPipeline(std::unique_ptr<IQrDecoder> decoder,
                               QrDetectionOptions options = {},
                               docscan::core::ScanObserver observer = {});

  /// Detections in discovery order. Non-Grayscale8 input yields nothing.
  [[nodiscard]] std::vector<docscan::core::QrDetection> detect(
      const docscan::core::Frame& gray);

  /// Same as detect(), also reporting which pass produced the detections.
  [[nodiscard]] docscan::core::QrScanResult scan(const docscan::core::Frame& gray);

  [[nodiscard]] const QrDetectionOptions& options() const noexcept { return options_; }

 private:
  std::vector<docscan::core::QrDetection> decode_grids(
      const docscan::core::Frame& image,
      float scale,
      const vision::PixelRect& region,
      int row,
      int col);

  std::vector<docscan::core::QrDetection> scan_regions(const docscan::core::Frame& gray);

  std::unique_ptr<IQrDecoder> decoder_;
  QrDetectionOptions options_;
  docscan::core::ScanObserver observer_;
};

}  // namespace docscan::qr
