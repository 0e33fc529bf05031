#pragma once

#include <docscan/core/error.hpp>
#include <docscan/core/mrz_record.hpp>
#include <docscan/core/scan_observer.hpp>
#include <cstddef>
#include <expected>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace docscan::mrz {

/// Padding character of MRZ fields.
inline constexpr char kFiller = '<';

/// Normalized lines shorter than this are treated as scanning noise.
inline constexpr std::size_t kMinLineLength = 20;

/// Placeholder score assigned to every successful parse. No check digits are verified.
inline constexpr float kStaticConfidence = 0.75f;

/// Split text into lines; per line drop ' ', trim whitespace, uppercase;
/// keep lines of at least min_line_length characters.
[[nodiscard]] std::vector<std::string> normalize_lines(
    std::string_view text, std::size_t min_line_length = kMinLineLength);

/// 3 lines -> TD1; 2 lines -> TD3 if the first has >= 40 characters, else TD2.
/// Any other count -> UnsupportedLineCount (actual = count).
[[nodiscard]] std::expected<docscan::core::MrzFormat, docscan::core::Error>
classify_format(const std::vector<std::string>& lines);

/// Fixed line width of a format: 30 (TD1), 36 (TD2), 44 (TD3).
[[nodiscard]] std::size_t line_width(docscan::core::MrzFormat format) noexcept;

/// Right-pad with kFiller or truncate to width.
[[nodiscard]] std::string fit_line(std::string_view line, std::size_t width);

/// Half-open [start, end) substring; empty when start is past the line, end clamped.
[[nodiscard]] std::string extract_field(std::string_view line,
                                        std::size_t start,
                                        std::size_t end);

/// Split a name field on "<<" into (surname, given names); fillers become spaces,
/// segments are trimmed and digit '0' is read as letter 'O'.
[[nodiscard]] std::pair<std::string, std::string> split_names(std::string_view name_field);

struct MrzParserOptions {
  std::size_t min_line_length{kMinLineLength};
};

/// Parses OCR'd MRZ text into an MrzRecord following the ICAO 9303 field layouts.
///
/// date_of_birth has letter 'O' read as digit '0'; date_of_expiry is taken as is.
class MrzParser {
 public:
  explicit MrzParser(MrzParserOptions options = {},
                     docscan::core::ScanObserver observer = {});

  /// NoValidLines when nothing survives normalization; UnsupportedLineCount
  /// when the surviving count matches no layout.
  [[nodiscard]] std::expected<docscan::core::MrzRecord, docscan::core::Error>
  parse(std::string_view text) const;

 private:
  MrzParserOptions options_;
  docscan::core::ScanObserver observer_;
};

}  // namespace docscan::mrz
