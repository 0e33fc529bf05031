#include <docscan/mrz/mrz_parser.hpp>
#include <algorithm>
#include <cctype>
#include <string>

namespace docscan::mrz {

namespace dc = docscan::core;

namespace {

constexpr std::size_t kTd3MinFirstLine = 40;

struct FieldRange {
  std::size_t line;
  std::size_t start;
  std::size_t end;
};

/// Field offsets into the width-fitted lines of one format.
struct Layout {
  std::size_t width;
  FieldRange issuing_country;
  FieldRange names;
  FieldRange document_number;
  FieldRange nationality;
  FieldRange date_of_birth;
  FieldRange sex;
  FieldRange date_of_expiry;
  FieldRange optional_data;
};

constexpr Layout kTd1{30,
                      {0, 2, 5}, {2, 0, 30}, {0, 5, 14}, {1, 15, 18},
                      {1, 0, 6}, {1, 7, 8}, {1, 8, 14}, {0, 15, 30}};
constexpr Layout kTd2{36,
                      {0, 2, 5}, {0, 5, 36}, {1, 0, 9}, {1, 10, 13},
                      {1, 13, 19}, {1, 20, 21}, {1, 21, 27}, {1, 28, 35}};
constexpr Layout kTd3{44,
                      {0, 2, 5}, {0, 5, 44}, {1, 0, 9}, {1, 10, 13},
                      {1, 13, 19}, {1, 20, 21}, {1, 21, 27}, {1, 28, 42}};

const Layout& layout_for(dc::MrzFormat format) {
  switch (format) {
    case dc::MrzFormat::TD1:
      return kTd1;
    case dc::MrzFormat::TD2:
      return kTd2;
    case dc::MrzFormat::TD3:
    default:
      return kTd3;
  }
}

std::string trim(std::string_view s) {
  const auto start = s.find_first_not_of(" \t\r\n\f\v");
  if (start == std::string_view::npos) return {};
  const auto end = s.find_last_not_of(" \t\r\n\f\v");
  return std::string(s.substr(start, end - start + 1));
}

std::string trim_trailing_filler(std::string s) {
  const auto end = s.find_last_not_of(kFiller);
  s.erase(end == std::string::npos ? 0 : end + 1);
  return s;
}

void replace_all(std::string& s, char from, char to) {
  std::replace(s.begin(), s.end(), from, to);
}

std::string clean_name_segment(std::string_view segment) {
  std::string s(segment);
  replace_all(s, kFiller, ' ');
  s = trim(s);
  replace_all(s, '0', 'O');
  return s;
}

std::string field(const std::vector<std::string>& lines, const FieldRange& r) {
  return extract_field(lines[r.line], r.start, r.end);
}

}  // namespace

std::vector<std::string> normalize_lines(std::string_view text,
                                         std::size_t min_line_length) {
  std::vector<std::string> lines;
  std::size_t pos = 0;
  while (pos <= text.size()) {
    const auto nl = text.find('\n', pos);
    const auto raw = text.substr(pos, nl == std::string_view::npos ? std::string_view::npos
                                                                    : nl - pos);
    std::string line;
    line.reserve(raw.size());
    for (const char c : raw) {
      if (c == ' ') continue;
      line.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    line = trim(line);
    if (line.size() >= min_line_length) {
      lines.push_back(std::move(line));
    }
    if (nl == std::string_view::npos) break;
    pos = nl + 1;
  }
  return lines;
}

std::expected<dc::MrzFormat, dc::Error> classify_format(
    const std::vector<std::string>& lines) {
  switch (lines.size()) {
    case 3:
      return dc::MrzFormat::TD1;
    case 2:
      return lines[0].size() >= kTd3MinFirstLine ? dc::MrzFormat::TD3
                                                 : dc::MrzFormat::TD2;
    default:
      return std::unexpected(
          dc::Error{dc::ErrorKind::UnsupportedLineCount, 0, lines.size(), {}});
  }
}

std::size_t line_width(dc::MrzFormat format) noexcept {
  return layout_for(format).width;
}

std::string fit_line(std::string_view line, std::size_t width) {
  std::string out(line.substr(0, width));
  out.resize(width, kFiller);
  return out;
}

std::string extract_field(std::string_view line, std::size_t start, std::size_t end) {
  if (start >= line.size() || end <= start) return {};
  end = std::min(end, line.size());
  return std::string(line.substr(start, end - start));
}

std::pair<std::string, std::string> split_names(std::string_view name_field) {
  constexpr std::string_view kSeparator{"<<"};
  const auto sep = name_field.find(kSeparator);
  if (sep == std::string_view::npos) {
    return {clean_name_segment(name_field), std::string{}};
  }

  const std::string_view rest = name_field.substr(sep + kSeparator.size());
  const auto next = rest.find(kSeparator);
  return {clean_name_segment(name_field.substr(0, sep)),
          clean_name_segment(rest.substr(0, next))};
}

MrzParser::MrzParser(MrzParserOptions options, dc::ScanObserver observer)
    : options_(options), observer_(std::move(observer)) {}

std::expected<dc::MrzRecord, dc::Error> MrzParser::parse(std::string_view text) const {
  std::vector<std::string> lines = normalize_lines(text, options_.min_line_length);
  dc::notify(observer_, {dc::ScanEventKind::MrzLinesNormalized, lines.size()});
  if (lines.empty()) {
    return std::unexpected(dc::make_error(dc::ErrorKind::NoValidLines));
  }

  auto format = classify_format(lines);
  if (!format) {
    return std::unexpected(std::move(format.error()));
  }
  dc::notify(observer_, {dc::ScanEventKind::MrzClassified, lines.size(), -1, -1, 0.f,
                         std::string(dc::to_string(*format))});

  const Layout& layout = layout_for(*format);
  for (auto& line : lines) {
    line = fit_line(line, layout.width);
  }

  dc::MrzRecord record;
  record.format = *format;
  record.issuing_country = field(lines, layout.issuing_country);
  record.document_number = trim_trailing_filler(field(lines, layout.document_number));
  record.nationality = field(lines, layout.nationality);
  record.date_of_birth = field(lines, layout.date_of_birth);
  replace_all(record.date_of_birth, 'O', '0');
  record.sex = field(lines, layout.sex);
  // No O -> 0 correction here, unlike date_of_birth.
  record.date_of_expiry = field(lines, layout.date_of_expiry);
  record.optional_data = trim_trailing_filler(field(lines, layout.optional_data));

  auto [surname, given_names] = split_names(field(lines, layout.names));
  record.surname = std::move(surname);
  record.given_names = std::move(given_names);

  record.raw_lines = std::move(lines);
  record.confidence = kStaticConfidence;
  return record;
}

}  // namespace docscan::mrz
