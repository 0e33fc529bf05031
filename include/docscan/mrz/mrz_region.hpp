#pragma once

#include <docscan/core/error.hpp>
#include <docscan/core/frame.hpp>
#include <docscan/vision/image_ops.hpp>
#include <expected>
#include <optional>

namespace docscan::mrz {

/// Upscale applied to the cropped zone before it is handed to OCR.
inline constexpr float kMrzZoneScale = 2.0f;

/// OCR pre-processing of a document photo: grayscale, sharpen,
/// contrast 2.0 / brightness +10, Otsu binarization. Returns Grayscale8.
[[nodiscard]] std::expected<docscan::core::Frame, docscan::core::Error>
preprocess_for_ocr(const docscan::core::Frame& input);

/// Locate the MRZ text band in a binarized Grayscale8 frame by horizontal
/// projection of dark pixels. Returns the bottom-most dense band of at least
/// 20 rows within the lower 70% of the frame, padded by 10 rows, full width.
[[nodiscard]] std::optional<vision::PixelRect> locate_mrz_region(
    const docscan::core::Frame& binary);

/// The OCR input for a located zone: region cropped from binary, then upscaled
/// by scale. Errors from crop / upscale are passed through.
[[nodiscard]] std::expected<docscan::core::Frame, docscan::core::Error>
extract_mrz_zone(const docscan::core::Frame& binary,
                 const vision::PixelRect& region,
                 float scale = kMrzZoneScale);

}  // namespace docscan::mrz
