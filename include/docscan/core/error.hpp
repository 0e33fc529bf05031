#pragma once

#include <cstddef>
#include <string>

namespace docscan::core {

/// Error kinds; used with std::expected for recoverable failures.
enum class ErrorKind {
  InvalidBufferSize,     // buffer length does not match width * height * channels
  InvalidFrame,          // empty frame or unsupported pixel format
  NoValidLines,          // no MRZ line survived normalization
  UnsupportedLineCount,  // MRZ line count is neither 2 nor 3
  DecodeFailed,          // single QR grid failed to decode; never leaves the scanner
  InvalidConfig,
  SerializationFailed,
};

/// Tagged error with the structured fields of its kind.
/// InvalidBufferSize: expected / actual byte counts.
/// UnsupportedLineCount: actual = number of usable lines.
/// SerializationFailed: detail = target path.
struct Error {
  ErrorKind kind{ErrorKind::InvalidFrame};
  std::size_t expected{0};
  std::size_t actual{0};
  std::string detail;
};

[[nodiscard]] inline Error make_error(ErrorKind kind) { return Error{kind, 0, 0, {}}; }

[[nodiscard]] inline bool operator==(const Error& a, ErrorKind k) noexcept {
  return a.kind == k;
}

/// Human-readable message for CLI output.
[[nodiscard]] std::string describe(const Error& error);

}  // namespace docscan::core
