#pragma once

#include <docscan/core/error.hpp>
#include <docscan/core/frame.hpp>
#include <docscan/core/pipeline_stage.hpp>
#include <expected>
#include <string_view>

namespace docscan::vision {

/// Converts a colour frame to Grayscale8 with BT.601 luma:
/// round(0.299 R + 0.587 G + 0.114 B). Alpha is ignored; Grayscale8 input is copied.
/// Fails with InvalidBufferSize when the buffer length does not match
/// width * height * channels, InvalidFrame for Unknown-format frames.
/// A zero-area frame with a matching (empty) buffer yields an empty Grayscale8 frame.
[[nodiscard]] std::expected<docscan::core::Frame, docscan::core::Error>
to_grayscale(const docscan::core::Frame& input);

/// Pipeline stage wrapper around to_grayscale().
class GrayscaleStage : public docscan::core::IPipelineStage {
 public:
  GrayscaleStage() = default;

  [[nodiscard]] std::string_view name() const noexcept override { return "grayscale"; }

  [[nodiscard]] std::expected<docscan::core::StageOutput, docscan::core::Error>
  process(const docscan::core::Frame& input,
          const docscan::core::ScanContext& context) override;
};

}  // namespace docscan::vision
