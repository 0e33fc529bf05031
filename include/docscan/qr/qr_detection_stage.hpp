#pragma once

#include <docscan/core/error.hpp>
#include <docscan/core/frame.hpp>
#include <docscan/core/pipeline_stage.hpp>
#include <docscan/core/scan_observer.hpp>
#include <docscan/qr/qr_decoder.hpp>
#include <docscan/qr/qr_detection_pipeline.hpp>
#include <expected>
#include <memory>
#include <string_view>

namespace docscan::qr {

/// Pipeline stage: QrDetectionPipeline over a Grayscale8 frame -> QrScanResult.
/// A zero-area frame yields an empty result (pass None) without touching the decoder.
class QrDetectionStage : public docscan::core::IPipelineStage {
 public:
  QrDetectionStage(std::unique_ptr<IQrDecoder> decoder,
                   QrDetectionOptions options = {},
                   docscan::core::ScanObserver observer = {});

  [[nodiscard]] std::string_view name() const noexcept override { return "qr-detect"; }

  [[nodiscard]] std::expected<docscan::core::StageOutput, docscan::core::Error>
  process(const docscan::core::Frame& input,
          const docscan::core::ScanContext& context) override;

 private:
  QrDetectionPipeline pipeline_;
};

}  // namespace docscan::qr
