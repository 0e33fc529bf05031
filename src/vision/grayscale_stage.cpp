#include <docscan/vision/grayscale_stage.hpp>
#include <docscan/core/error.hpp>
#include <docscan/core/frame.hpp>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace docscan::vision {

namespace {

struct ChannelOffsets {
  std::size_t r;
  std::size_t g;
  std::size_t b;
};

ChannelOffsets offsets_for(docscan::core::PixelFormat format) {
  using docscan::core::PixelFormat;
  switch (format) {
    case PixelFormat::BGR8:
    case PixelFormat::BGRA8:
      return {2, 1, 0};
    case PixelFormat::RGB8:
    case PixelFormat::RGBA8:
    default:
      return {0, 1, 2};
  }
}

}  // namespace

std::expected<docscan::core::Frame, docscan::core::Error>
to_grayscale(const docscan::core::Frame& input) {
  using namespace docscan::core;

  const std::size_t channels = Frame::channels(input.format());
  if (channels == 0) {
    return std::unexpected(make_error(ErrorKind::InvalidFrame));
  }

  const std::size_t expected =
      Frame::expected_bytes(input.width(), input.height(), input.format());
  if (input.size_bytes() != expected) {
    return std::unexpected(
        Error{ErrorKind::InvalidBufferSize, expected, input.size_bytes(), {}});
  }
  if (input.format() == PixelFormat::Grayscale8 || expected == 0) {
    std::vector<std::byte> buf(input.data().begin(), input.data().end());
    return Frame(input.width(), input.height(), PixelFormat::Grayscale8, std::move(buf));
  }

  const ChannelOffsets off = offsets_for(input.format());
  const auto src = input.data();
  const std::size_t pixels = static_cast<std::size_t>(input.width()) * input.height();
  std::vector<std::byte> gray(pixels);

  for (std::size_t i = 0; i < pixels; ++i) {
    const std::size_t idx = i * channels;
    const double r = static_cast<double>(std::to_integer<std::uint8_t>(src[idx + off.r]));
    const double g = static_cast<double>(std::to_integer<std::uint8_t>(src[idx + off.g]));
    const double b = static_cast<double>(std::to_integer<std::uint8_t>(src[idx + off.b]));
    const long luma = std::lround(0.299 * r + 0.587 * g + 0.114 * b);
    gray[i] = static_cast<std::byte>(static_cast<std::uint8_t>(luma > 255 ? 255 : luma));
  }

  return Frame(input.width(), input.height(), PixelFormat::Grayscale8, std::move(gray));
}

std::expected<docscan::core::StageOutput, docscan::core::Error>
GrayscaleStage::process(const docscan::core::Frame& input,
                        const docscan::core::ScanContext& /*context*/) {
  auto gray = to_grayscale(input);
  if (!gray) {
    return std::unexpected(std::move(gray.error()));
  }
  return docscan::core::StageOutput{std::move(*gray)};
}

}  // namespace docscan::vision
