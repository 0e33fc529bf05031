#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace docscan::core {

/// Pixel coordinate (sub-pixel precision).
struct Point2 {
  float x{0.f};
  float y{0.f};
};

/// Four corners of a QR symbol, in decoder winding order.
using BoundingQuad = std::array<Point2, 4>;

/// Single decoded QR symbol. Bounds are in full-frame pixel space.
struct QrDetection {
  std::string payload;
  int version{0};
  BoundingQuad bounds{};
};

/// Which pass produced the detections of a scan.
enum class ScanPass : std::uint8_t {
  None,      // nothing found
  Standard,  // full-frame pass
  Fallback,  // region-tiling pass
};

/// Result of the QR pipeline for one frame.
struct QrScanResult {
  std::uint64_t frame_id{0};
  std::vector<QrDetection> detections;
  ScanPass pass{ScanPass::None};

  /// Which camera produced this frame (e.g. "cam_1", "gate_3"). Set by app or batch runner.
  std::optional<std::string> camera_id;
};

}  // namespace docscan::core
