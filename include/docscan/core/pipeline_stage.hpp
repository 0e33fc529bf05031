#pragma once

#include <docscan/core/error.hpp>
#include <docscan/core/frame.hpp>
#include <docscan/core/qr_detection.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace docscan::core {

/// Identity of the frame being scanned. The pipeline stamps it on the final
/// QrScanResult; stages may read it (e.g. for observer events) but never own it.
struct ScanContext {
  std::uint64_t frame_id{0};
  std::optional<std::string> camera_id;
};

/// Output of a pipeline stage: either pass-through Frame or final QrScanResult.
using StageOutput = std::variant<Frame, QrScanResult>;

/// Abstract pipeline stage: process one Frame, return Frame (continue) or QrScanResult (done).
class IPipelineStage {
 public:
  virtual ~IPipelineStage() = default;

  /// Short stable name reported in stage timings ("grayscale", "qr-detect").
  [[nodiscard]] virtual std::string_view name() const noexcept = 0;

  [[nodiscard]] virtual std::expected<StageOutput, Error> process(
      const Frame& input, const ScanContext& context) = 0;
};

}  // namespace docscan::core
