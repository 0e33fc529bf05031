#include <docscan/qr/mock_qr_decoder.hpp>
#include <docscan/core/error.hpp>
#include <vector>

namespace docscan::qr {

void MockQrDecoder::set_script(std::vector<std::vector<MockSymbol>> per_call) {
  script_ = std::move(per_call);
}

void MockQrDecoder::set_default(std::vector<MockSymbol> symbols) {
  default_ = std::move(symbols);
}

std::vector<QrGrid> MockQrDecoder::detect_grids(const docscan::core::Frame& gray) {
  const std::size_t call = seen_sizes_.size();
  seen_sizes_.emplace_back(gray.width(), gray.height());
  current_ = call < script_.size() ? script_[call] : default_;

  std::vector<QrGrid> grids;
  grids.reserve(current_.size());
  for (std::size_t i = 0; i < current_.size(); ++i) {
    grids.push_back(QrGrid{current_[i].bounds, i});
  }
  return grids;
}

std::expected<DecodedSymbol, docscan::core::Error> MockQrDecoder::decode(
    const docscan::core::Frame& /*gray*/, const QrGrid& grid) {
  if (grid.handle >= current_.size() || !current_[grid.handle].decodable) {
    return std::unexpected(
        docscan::core::make_error(docscan::core::ErrorKind::DecodeFailed));
  }
  const MockSymbol& s = current_[grid.handle];
  return DecodedSymbol{s.version, s.payload};
}

}  // namespace docscan::qr
