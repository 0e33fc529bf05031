#pragma once

#include <docscan/core/error.hpp>
#include <docscan/core/frame.hpp>
#include <docscan/core/pipeline_stage.hpp>
#include <docscan/core/qr_detection.hpp>
#include <cstddef>
#include <expected>
#include <functional>
#include <memory>
#include <string_view>
#include <vector>

namespace docscan::core {

/// Wall time of one stage in one run.
struct StageTiming {
  std::size_t index{0};
  std::string_view stage;  // IPipelineStage::name(), valid while the pipeline lives
  double duration_ms{0.0};
};

/// Called after each executed stage. Optional; pass to run().
using StageTimingCallback = std::function<void(const StageTiming&)>;

/// Scan pipeline: frame-transforming stages followed by one stage that emits
/// the QrScanResult. The result carries the frame_id / camera_id of the
/// ScanContext given to run(), whatever the emitting stage filled in.
///
/// Not thread-safe: stages hold non-thread-safe decoders. Use one Pipeline per thread.
class Pipeline {
 public:
  Pipeline() = default;

  void add_stage(std::unique_ptr<IPipelineStage> stage);

  /// Run on one frame. The first stage error is returned unchanged; a pipeline
  /// whose stages never emit a result yields InvalidConfig.
  [[nodiscard]] std::expected<QrScanResult, Error> run(
      const Frame& input,
      const ScanContext& context = {},
      const StageTimingCallback& timing_cb = {});

  [[nodiscard]] std::size_t stage_count() const noexcept {
    return stages_.size();
  }

  /// Stage names in execution order.
  [[nodiscard]] std::vector<std::string_view> stage_names() const;

 private:
  std::vector<std::unique_ptr<IPipelineStage>> stages_;
};

}  // namespace docscan::core
