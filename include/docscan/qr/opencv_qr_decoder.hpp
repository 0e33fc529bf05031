#pragma once

#include <docscan/core/error.hpp>
#include <docscan/core/frame.hpp>
#include <docscan/qr/qr_decoder.hpp>
#include <memory>
#include <vector>

namespace docscan::qr {

/// IQrDecoder backed by cv::QRCodeDetector (OpenCV objdetect).
///
/// detect_grids() runs multi-code localization and falls back to single-code
/// localization when that finds nothing. decode() reports the symbol version
/// from the side length of the rectified module matrix (21 + 4 * (version - 1)).
/// OpenCV exceptions raised while handling one grid are reported as DecodeFailed.
class OpenCvQrDecoder : public IQrDecoder {
 public:
  OpenCvQrDecoder();
  ~OpenCvQrDecoder() override;

  OpenCvQrDecoder(const OpenCvQrDecoder&) = delete;
  OpenCvQrDecoder& operator=(const OpenCvQrDecoder&) = delete;

  [[nodiscard]] std::vector<QrGrid> detect_grids(
      const docscan::core::Frame& gray) override;

  [[nodiscard]] std::expected<DecodedSymbol, docscan::core::Error> decode(
      const docscan::core::Frame& gray, const QrGrid& grid) override;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace docscan::qr
