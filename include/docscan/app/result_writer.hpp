#pragma once

#include <docscan/core/error.hpp>
#include <docscan/core/mrz_record.hpp>
#include <docscan/core/qr_detection.hpp>
#include <docscan/mrz/mrz_validation.hpp>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

namespace docscan::app {

/// Text form of a scan: summary line "frame_id=.. codes=.. pass=..", then one
/// indented line per detection with payload, version and the four corners.
[[nodiscard]] std::string format_qr_results(const docscan::core::QrScanResult& result);

/// Text form of an MRZ record, one "key=value" per line. When validation is
/// given, its verdict and errors are appended.
[[nodiscard]] std::string format_mrz_record(const docscan::core::MrzRecord& record,
                                            const mrz::MrzValidation* validation = nullptr);

/// Write text to path, creating parent directories.
/// SerializationFailed (detail = path) when the file cannot be written.
[[nodiscard]] std::expected<void, docscan::core::Error> write_text(
    const std::filesystem::path& path, std::string_view text);

}  // namespace docscan::app
