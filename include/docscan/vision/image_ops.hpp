#pragma once

#include <docscan/core/error.hpp>
#include <docscan/core/frame.hpp>
#include <cstdint>
#include <expected>

namespace docscan::vision {

/// Axis-aligned pixel rectangle.
struct PixelRect {
  std::uint32_t x{0};
  std::uint32_t y{0};
  std::uint32_t width{0};
  std::uint32_t height{0};
};

/// Copy of the part of input covered by rect. rect is clipped to the frame;
/// an empty intersection yields InvalidFrame.
[[nodiscard]] std::expected<docscan::core::Frame, docscan::core::Error>
crop(const docscan::core::Frame& input, const PixelRect& rect);

/// Resize by scale with Lanczos interpolation to
/// (uint32(width * scale), uint32(height * scale)).
[[nodiscard]] std::expected<docscan::core::Frame, docscan::core::Error>
upscale(const docscan::core::Frame& input, float scale);

/// 3x3 sharpening kernel (centre 5, 4-neighbours -1).
[[nodiscard]] std::expected<docscan::core::Frame, docscan::core::Error>
sharpen(const docscan::core::Frame& input);

/// Linear contrast around mid-grey: v' = (v - 128) * contrast + 128 + brightness, saturated.
[[nodiscard]] std::expected<docscan::core::Frame, docscan::core::Error>
adjust_contrast(const docscan::core::Frame& input, float contrast, float brightness);

/// Otsu binarization of a Grayscale8 frame: values above the threshold become 255, others 0.
[[nodiscard]] std::expected<docscan::core::Frame, docscan::core::Error>
otsu_threshold(const docscan::core::Frame& input);

}  // namespace docscan::vision
