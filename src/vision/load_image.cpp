#include <docscan/vision/load_image.hpp>
#include "frame_cv_utils.hpp"
#include <docscan/core/frame.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <vector>

namespace docscan::vision {

std::optional<docscan::core::Frame> load_frame_from_image(const std::string& path) {
  cv::Mat mat = cv::imread(path, cv::IMREAD_UNCHANGED);
  if (mat.empty() || mat.depth() != CV_8U) return std::nullopt;

  cv::Mat rgba;
  switch (mat.channels()) {
    case 1:
      cv::cvtColor(mat, rgba, cv::COLOR_GRAY2RGBA);
      break;
    case 3:
      cv::cvtColor(mat, rgba, cv::COLOR_BGR2RGBA);
      break;
    case 4:
      cv::cvtColor(mat, rgba, cv::COLOR_BGRA2RGBA);
      break;
    default:
      return std::nullopt;
  }

  return detail::mat_to_frame(rgba, docscan::core::PixelFormat::RGBA8);
}

std::expected<void, docscan::core::Error> save_frame_to_image(
    const docscan::core::Frame& frame, const std::string& path) {
  using docscan::core::PixelFormat;
  const docscan::core::Error failure{docscan::core::ErrorKind::SerializationFailed, 0, 0, path};

  auto mat = detail::frame_to_mat(frame);
  if (!mat) return std::unexpected(failure);

  // imwrite expects BGR channel order.
  cv::Mat bgr;
  switch (frame.format()) {
    case PixelFormat::RGB8:
      cv::cvtColor(*mat, bgr, cv::COLOR_RGB2BGR);
      break;
    case PixelFormat::RGBA8:
      cv::cvtColor(*mat, bgr, cv::COLOR_RGBA2BGRA);
      break;
    default:
      bgr = *mat;
      break;
  }

  try {
    if (!cv::imwrite(path, bgr)) return std::unexpected(failure);
  } catch (const cv::Exception&) {
    // Unknown extension or encoder failure.
    return std::unexpected(failure);
  }
  return {};
}

}  // namespace docscan::vision
