#include <docscan/qr/opencv_qr_decoder.hpp>
#include "../vision/frame_cv_utils.hpp"
#include <docscan/core/error.hpp>
#include <opencv2/core.hpp>
#include <opencv2/objdetect.hpp>
#include <cstddef>
#include <string>
#include <vector>

namespace docscan::qr {

namespace dc = docscan::core;

namespace {

constexpr int kVersion1Modules = 21;
constexpr int kModulesPerVersion = 4;

int version_from_modules(int side) {
  if (side < kVersion1Modules) return 0;
  return (side - kVersion1Modules) / kModulesPerVersion + 1;
}

}  // namespace

struct OpenCvQrDecoder::Impl {
  cv::QRCodeDetector detector;
};

OpenCvQrDecoder::OpenCvQrDecoder() : impl_(std::make_unique<Impl>()) {}

OpenCvQrDecoder::~OpenCvQrDecoder() = default;

std::vector<QrGrid> OpenCvQrDecoder::detect_grids(const dc::Frame& gray) {
  std::vector<QrGrid> grids;
  if (gray.format() != dc::PixelFormat::Grayscale8) return grids;
  auto mat = vision::detail::frame_to_mat(gray);
  if (!mat) return grids;

  std::vector<cv::Point2f> points;
  try {
    if (!impl_->detector.detectMulti(*mat, points) || points.empty()) {
      points.clear();
      if (!impl_->detector.detect(*mat, points)) {
        return grids;
      }
    }
  } catch (const cv::Exception&) {
    // Localization failure on unusual input means no candidates.
    return grids;
  }

  for (std::size_t i = 0; i + 3 < points.size(); i += 4) {
    QrGrid grid;
    for (std::size_t j = 0; j < 4; ++j) {
      grid.bounds[j] = dc::Point2{points[i + j].x, points[i + j].y};
    }
    grid.handle = i / 4;
    grids.push_back(grid);
  }
  return grids;
}

std::expected<DecodedSymbol, dc::Error> OpenCvQrDecoder::decode(
    const dc::Frame& gray, const QrGrid& grid) {
  auto mat = vision::detail::frame_to_mat(gray);
  if (!mat || gray.format() != dc::PixelFormat::Grayscale8) {
    return std::unexpected(dc::make_error(dc::ErrorKind::InvalidFrame));
  }

  std::vector<cv::Point2f> corners;
  corners.reserve(grid.bounds.size());
  for (const auto& p : grid.bounds) {
    corners.emplace_back(p.x, p.y);
  }

  std::string payload;
  cv::Mat straight;
  try {
    payload = impl_->detector.decode(*mat, corners, straight);
  } catch (const cv::Exception&) {
    return std::unexpected(dc::make_error(dc::ErrorKind::DecodeFailed));
  }
  if (payload.empty()) {
    return std::unexpected(dc::make_error(dc::ErrorKind::DecodeFailed));
  }

  return DecodedSymbol{version_from_modules(straight.cols), std::move(payload)};
}

}  // namespace docscan::qr
