#pragma once

#include <docscan/core/qr_detection.hpp>
#include <docscan/qr/qr_decoder.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace docscan::qr {

/// Symbol reported by MockQrDecoder. Bounds are in the coordinates of the
/// image passed to detect_grids().
struct MockSymbol {
  std::string payload;
  int version{1};
  docscan::core::BoundingQuad bounds{};
  bool decodable{true};
};

/// Scripted decoder (for tests/demo): the n-th detect_grids() call returns the
/// n-th scripted symbol list, or the default list when the script is exhausted.
/// Records the size of every image it was given.
class MockQrDecoder : public IQrDecoder {
 public:
  void set_script(std::vector<std::vector<MockSymbol>> per_call);
  void set_default(std::vector<MockSymbol> symbols);

  [[nodiscard]] std::vector<QrGrid> detect_grids(
      const docscan::core::Frame& gray) override;

  [[nodiscard]] std::expected<DecodedSymbol, docscan::core::Error> decode(
      const docscan::core::Frame& gray, const QrGrid& grid) override;

  [[nodiscard]] std::size_t detect_calls() const noexcept { return seen_sizes_.size(); }

  /// (width, height) of each image handed to detect_grids(), in call order.
  [[nodiscard]] const std::vector<std::pair<std::uint32_t, std::uint32_t>>&
  seen_sizes() const noexcept {
    return seen_sizes_;
  }

 private:
  std::vector<std::vector<MockSymbol>> script_;
  std::vector<MockSymbol> default_;
  std::vector<MockSymbol> current_;
  std::vector<std::pair<std::uint32_t, std::uint32_t>> seen_sizes_;
};

}  // namespace docscan::qr
