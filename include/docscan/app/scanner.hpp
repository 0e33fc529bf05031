#pragma once

#include <docscan/app/config.hpp>
#include <docscan/core/error.hpp>
#include <docscan/core/mrz_record.hpp>
#include <docscan/core/pipeline.hpp>
#include <docscan/core/qr_detection.hpp>
#include <docscan/core/scan_observer.hpp>
#include <docscan/qr/qr_decoder.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <string_view>
#include <vector>

namespace docscan::app {

/// Decoder used when the caller supplies none (OpenCV QRCodeDetector).
[[nodiscard]] std::unique_ptr<qr::IQrDecoder> make_default_decoder();

/// Grayscale -> QR detection pipeline. A null decoder selects make_default_decoder().
[[nodiscard]] docscan::core::Pipeline build_qr_pipeline(
    const ScannerConfig& config,
    std::unique_ptr<qr::IQrDecoder> decoder = nullptr,
    docscan::core::ScanObserver observer = {});

/// Decode QR codes from a tightly packed RGBA8 buffer.
/// InvalidBufferSize (expected = width * height * 4, actual = rgba.size()) on a
/// length mismatch; InvalidConfig for an unusable config. Finding nothing is
/// not an error: the result is an empty vector, as it is for a zero-area image.
[[nodiscard]] std::expected<std::vector<docscan::core::QrDetection>, docscan::core::Error>
decode_qr(std::span<const std::byte> rgba,
          std::uint32_t width,
          std::uint32_t height,
          const ScannerConfig& config,
          std::unique_ptr<qr::IQrDecoder> decoder = nullptr,
          docscan::core::ScanObserver observer = {});

/// decode_qr() with default_config() and the default decoder.
[[nodiscard]] std::expected<std::vector<docscan::core::QrDetection>, docscan::core::Error>
decode_qr(std::span<const std::byte> rgba, std::uint32_t width, std::uint32_t height);

/// Parse OCR'd MRZ text. NoValidLines or UnsupportedLineCount on unusable input.
[[nodiscard]] std::expected<docscan::core::MrzRecord, docscan::core::Error>
parse_mrz(std::string_view text,
          const ScannerConfig& config,
          docscan::core::ScanObserver observer = {});

/// parse_mrz() with default_config().
[[nodiscard]] std::expected<docscan::core::MrzRecord, docscan::core::Error>
parse_mrz(std::string_view text);

}  // namespace docscan::app
