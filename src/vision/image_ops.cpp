#include <docscan/vision/image_ops.hpp>
#include "frame_cv_utils.hpp"
#include <docscan/core/error.hpp>
#include <docscan/core/frame.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>

namespace docscan::vision {

namespace dc = docscan::core;

std::expected<dc::Frame, dc::Error> crop(const dc::Frame& input, const PixelRect& rect) {
  auto mat_in = detail::frame_to_mat(input);
  if (!mat_in) {
    return std::unexpected(dc::make_error(dc::ErrorKind::InvalidFrame));
  }

  const cv::Rect requested(static_cast<int>(rect.x), static_cast<int>(rect.y),
                           static_cast<int>(rect.width), static_cast<int>(rect.height));
  const cv::Rect clipped = requested & cv::Rect(0, 0, mat_in->cols, mat_in->rows);
  if (clipped.empty()) {
    return std::unexpected(dc::make_error(dc::ErrorKind::InvalidFrame));
  }

  return detail::mat_to_frame((*mat_in)(clipped), input.format());
}

std::expected<dc::Frame, dc::Error> upscale(const dc::Frame& input, float scale) {
  auto mat_in = detail::frame_to_mat(input);
  if (!mat_in || scale <= 0.f) {
    return std::unexpected(dc::make_error(dc::ErrorKind::InvalidFrame));
  }

  const auto new_width = static_cast<std::uint32_t>(static_cast<float>(input.width()) * scale);
  const auto new_height = static_cast<std::uint32_t>(static_cast<float>(input.height()) * scale);
  if (new_width == 0 || new_height == 0) {
    return std::unexpected(dc::make_error(dc::ErrorKind::InvalidFrame));
  }

  cv::Mat mat_out;
  cv::resize(*mat_in, mat_out,
             cv::Size(static_cast<int>(new_width), static_cast<int>(new_height)),
             0, 0, cv::INTER_LANCZOS4);
  return detail::mat_to_frame(mat_out, input.format());
}

std::expected<dc::Frame, dc::Error> sharpen(const dc::Frame& input) {
  auto mat_in = detail::frame_to_mat(input);
  if (!mat_in) {
    return std::unexpected(dc::make_error(dc::ErrorKind::InvalidFrame));
  }

  const cv::Mat kernel = (cv::Mat_<float>(3, 3) << 0, -1, 0,
                                                   -1, 5, -1,
                                                   0, -1, 0);
  cv::Mat mat_out;
  cv::filter2D(*mat_in, mat_out, -1, kernel, cv::Point(-1, -1), 0, cv::BORDER_REPLICATE);
  return detail::mat_to_frame(mat_out, input.format());
}

std::expected<dc::Frame, dc::Error> adjust_contrast(const dc::Frame& input,
                                                    float contrast,
                                                    float brightness) {
  auto mat_in = detail::frame_to_mat(input);
  if (!mat_in) {
    return std::unexpected(dc::make_error(dc::ErrorKind::InvalidFrame));
  }

  cv::Mat mat_out;
  const double alpha = contrast;
  const double beta = 128.0 * (1.0 - alpha) + brightness;
  mat_in->convertTo(mat_out, -1, alpha, beta);
  return detail::mat_to_frame(mat_out, input.format());
}

std::expected<dc::Frame, dc::Error> otsu_threshold(const dc::Frame& input) {
  if (input.format() != dc::PixelFormat::Grayscale8) {
    return std::unexpected(dc::make_error(dc::ErrorKind::InvalidFrame));
  }
  auto mat_in = detail::frame_to_mat(input);
  if (!mat_in) {
    return std::unexpected(dc::make_error(dc::ErrorKind::InvalidFrame));
  }

  cv::Mat mat_out;
  cv::threshold(*mat_in, mat_out, 0, 255, cv::THRESH_BINARY | cv::THRESH_OTSU);
  return detail::mat_to_frame(mat_out, dc::PixelFormat::Grayscale8);
}

}  // namespace docscan::vision
