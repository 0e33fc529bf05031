#include <docscan/qr/qr_detection_stage.hpp>
#include <docscan/core/qr_detection.hpp>

namespace docscan::qr {

QrDetectionStage::QrDetectionStage(std::unique_ptr<IQrDecoder> decoder,
                                   QrDetectionOptions options,
                                   docscan::core::ScanObserver observer)
    : pipeline_(std::move(decoder), std::move(options), std::move(observer)) {}

std::expected<docscan::core::StageOutput, docscan::core::Error>
QrDetectionStage::process(const docscan::core::Frame& input,
                          const docscan::core::ScanContext& context) {
  using namespace docscan::core;
  if (input.format() != PixelFormat::Grayscale8) {
    return std::unexpected(make_error(ErrorKind::InvalidFrame));
  }

  QrScanResult out;
  if (input.width() != 0 && input.height() != 0) {
    out = pipeline_.scan(input);
  }
  out.frame_id = context.frame_id;
  out.camera_id = context.camera_id;
  return StageOutput{std::move(out)};
}

}  // namespace docscan::qr
