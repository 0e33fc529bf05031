#include <docscan/core/error.hpp>
#include <string>

namespace docscan::core {

std::string describe(const Error& error) {
  switch (error.kind) {
    case ErrorKind::InvalidBufferSize:
      return "invalid buffer size: expected " + std::to_string(error.expected) +
             " bytes, got " + std::to_string(error.actual);
    case ErrorKind::InvalidFrame:
      return "invalid frame";
    case ErrorKind::NoValidLines:
      return "no valid MRZ lines found";
    case ErrorKind::UnsupportedLineCount:
      return "unsupported MRZ line count: " + std::to_string(error.actual);
    case ErrorKind::DecodeFailed:
      return "QR decode failed";
    case ErrorKind::InvalidConfig:
      return error.detail.empty() ? "invalid configuration"
                                  : "invalid configuration: " + error.detail;
    case ErrorKind::SerializationFailed:
      return "failed to write results to " + error.detail;
  }
  return "unknown error";
}

}  // namespace docscan::core
