#pragma once

#include <docscan/core/frame.hpp>
#include <opencv2/core/mat.hpp>
#include <optional>

namespace docscan::vision::detail {

/// Convert Frame to cv::Mat (shared view, no copy). Returns nullopt if format unsupported
/// or the buffer does not match the frame dimensions.
std::optional<cv::Mat> frame_to_mat(const docscan::core::Frame& frame);

/// Convert cv::Mat to Frame (copy; non-continuous mats are compacted).
docscan::core::Frame mat_to_frame(const cv::Mat& mat,
                                  docscan::core::PixelFormat format);

}  // namespace docscan::vision::detail
