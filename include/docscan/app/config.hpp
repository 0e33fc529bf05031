#pragma once

#include <docscan/core/error.hpp>
#include <docscan/qr/qr_detection_pipeline.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <vector>

namespace docscan::app {

/// Scanner configuration: QR fallback behaviour, MRZ noise filter, worker count.
struct ScannerConfig {
  bool fallback_enabled{true};
  qr::FallbackPolicy fallback_policy{qr::FallbackPolicy::StopAtFirstMatch};
  std::uint32_t fallback_min_dimension{qr::kFallbackMinDimension};
  std::vector<float> fallback_scales;
  std::size_t mrz_min_line_length{20};
  std::size_t num_workers{0};  // 0 = hardware concurrency
};

/// Load config from a simple key=value file (one per line) or use defaults.
/// Keys: fallback_enabled, fallback_policy (first_match | exhaustive),
/// fallback_min_dimension, fallback_scales (comma-separated),
/// mrz_min_line_length, num_workers.
ScannerConfig load_config(const std::string& path);

/// Default config when no file is provided.
ScannerConfig default_config();

/// InvalidConfig when the scale list is empty or holds a non-positive factor.
[[nodiscard]] std::expected<void, docscan::core::Error> validate_config(
    const ScannerConfig& config);

/// QR pipeline options derived from config.
[[nodiscard]] qr::QrDetectionOptions to_detection_options(const ScannerConfig& config);

}  // namespace docscan::app
