#pragma once

#include <docscan/core/error.hpp>
#include <docscan/core/frame.hpp>
#include <docscan/core/qr_detection.hpp>
#include <cstddef>
#include <expected>
#include <string>
#include <vector>

namespace docscan::qr {

/// Candidate QR symbol located by the detector, prior to payload decoding.
struct QrGrid {
  docscan::core::BoundingQuad bounds{};  // in the detected image's own coordinates
  std::size_t handle{0};                 // decoder-private index
};

/// Payload and size class of a decoded symbol.
struct DecodedSymbol {
  int version{0};
  std::string payload;
};

/// Abstract QR symbol detector/decoder. Input frames are Grayscale8.
/// Implementations may keep per-call state between detect_grids() and decode(),
/// so one instance must not be used from several threads at once.
class IQrDecoder {
 public:
  virtual ~IQrDecoder() = default;

  /// Locate candidate grids. An empty vector means nothing was found.
  [[nodiscard]] virtual std::vector<QrGrid> detect_grids(
      const docscan::core::Frame& gray) = 0;

  /// Decode one grid returned by the last detect_grids() call on the same image.
  /// Fails with DecodeFailed for damaged or noisy symbols.
  [[nodiscard]] virtual std::expected<DecodedSymbol, docscan::core::Error> decode(
      const docscan::core::Frame& gray, const QrGrid& grid) = 0;
};

}  // namespace docscan::qr
