#include <docscan/app/scanner.hpp>
#include <docscan/core/frame.hpp>
#include <docscan/mrz/mrz_parser.hpp>
#include <docscan/qr/opencv_qr_decoder.hpp>
#include <docscan/qr/qr_detection_stage.hpp>
#include <docscan/vision/grayscale_stage.hpp>
#include <vector>

namespace docscan::app {

namespace dc = docscan::core;

std::unique_ptr<qr::IQrDecoder> make_default_decoder() {
  return std::make_unique<qr::OpenCvQrDecoder>();
}

dc::Pipeline build_qr_pipeline(const ScannerConfig& config,
                               std::unique_ptr<qr::IQrDecoder> decoder,
                               dc::ScanObserver observer) {
  if (!decoder) {
    decoder = make_default_decoder();
  }

  dc::Pipeline pipeline;
  pipeline.add_stage(std::make_unique<vision::GrayscaleStage>());
  pipeline.add_stage(std::make_unique<qr::QrDetectionStage>(
      std::move(decoder), to_detection_options(config), std::move(observer)));
  return pipeline;
}

std::expected<std::vector<dc::QrDetection>, dc::Error>
decode_qr(std::span<const std::byte> rgba,
          std::uint32_t width,
          std::uint32_t height,
          const ScannerConfig& config,
          std::unique_ptr<qr::IQrDecoder> decoder,
          dc::ScanObserver observer) {
  const std::size_t expected =
      dc::Frame::expected_bytes(width, height, dc::PixelFormat::RGBA8);
  if (rgba.size() != expected) {
    return std::unexpected(
        dc::Error{dc::ErrorKind::InvalidBufferSize, expected, rgba.size(), {}});
  }

  auto valid = validate_config(config);
  if (!valid) {
    return std::unexpected(std::move(valid.error()));
  }
  if (width == 0 || height == 0) {
    return std::vector<dc::QrDetection>{};
  }

  dc::Frame frame(width, height, dc::PixelFormat::RGBA8,
                  std::vector<std::byte>(rgba.begin(), rgba.end()));
  dc::Pipeline pipeline =
      build_qr_pipeline(config, std::move(decoder), std::move(observer));

  auto result = pipeline.run(frame);
  if (!result) {
    return std::unexpected(std::move(result.error()));
  }
  return std::move(result->detections);
}

std::expected<std::vector<dc::QrDetection>, dc::Error>
decode_qr(std::span<const std::byte> rgba, std::uint32_t width, std::uint32_t height) {
  return decode_qr(rgba, width, height, default_config());
}

std::expected<dc::MrzRecord, dc::Error> parse_mrz(std::string_view text,
                                                  const ScannerConfig& config,
                                                  dc::ScanObserver observer) {
  mrz::MrzParserOptions options;
  options.min_line_length = config.mrz_min_line_length;
  const mrz::MrzParser parser(options, std::move(observer));
  return parser.parse(text);
}

std::expected<dc::MrzRecord, dc::Error> parse_mrz(std::string_view text) {
  return parse_mrz(text, default_config());
}

}  // namespace docscan::app
