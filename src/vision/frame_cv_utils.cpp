#include "frame_cv_utils.hpp"
#include <docscan/core/frame.hpp>
#include <opencv2/core.hpp>
#include <cstddef>
#include <cstring>
#include <vector>

namespace docscan::vision::detail {

namespace dc = docscan::core;

std::optional<cv::Mat> frame_to_mat(const dc::Frame& frame) {
  if (frame.empty()) return std::nullopt;
  if (frame.size_bytes() !=
      dc::Frame::expected_bytes(frame.width(), frame.height(), frame.format())) {
    return std::nullopt;
  }

  const int w = static_cast<int>(frame.width());
  const int h = static_cast<int>(frame.height());
  auto* data = const_cast<std::byte*>(frame.data().data());

  switch (frame.format()) {
    case dc::PixelFormat::Grayscale8:
      return cv::Mat(h, w, CV_8UC1, data);
    case dc::PixelFormat::RGB8:
    case dc::PixelFormat::BGR8:
      return cv::Mat(h, w, CV_8UC3, data);
    case dc::PixelFormat::RGBA8:
    case dc::PixelFormat::BGRA8:
      return cv::Mat(h, w, CV_8UC4, data);
    case dc::PixelFormat::Unknown:
    default:
      return std::nullopt;
  }
}

dc::Frame mat_to_frame(const cv::Mat& mat, dc::PixelFormat format) {
  if (mat.empty()) return dc::Frame();

  const cv::Mat compact = mat.isContinuous() ? mat : mat.clone();
  const std::uint32_t w = static_cast<std::uint32_t>(compact.cols);
  const std::uint32_t h = static_cast<std::uint32_t>(compact.rows);
  const std::size_t len = compact.total() * compact.elemSize();
  std::vector<std::byte> buffer(len);
  std::memcpy(buffer.data(), compact.ptr(), len);
  return dc::Frame(w, h, format, std::move(buffer));
}

}  // namespace docscan::vision::detail
