#include <docscan/mrz/mrz_validation.hpp>
#include <algorithm>
#include <array>
#include <cctype>

namespace docscan::mrz {

namespace {

constexpr int kCenturyPivot = 50;
constexpr std::array<std::string_view, 4> kSexMarkers{"M", "F", "X", "<"};

bool all_digits(std::string_view s) {
  return std::all_of(s.begin(), s.end(),
                     [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; });
}

}  // namespace

std::string format_mrz_date(std::string_view mrz_date) {
  if (mrz_date.size() != 6) return std::string(mrz_date);

  const std::string_view yy = mrz_date.substr(0, 2);
  const std::string_view mm = mrz_date.substr(2, 2);
  const std::string_view dd = mrz_date.substr(4, 2);

  int year = 0;
  if (all_digits(yy)) {
    year = (yy[0] - '0') * 10 + (yy[1] - '0');
  }
  const std::string century = year > kCenturyPivot ? "19" : "20";

  std::string out = century;
  out.append(yy).append("-").append(mm).append("-").append(dd);
  return out;
}

MrzValidation validate_mrz(const docscan::core::MrzRecord& record) {
  MrzValidation v;

  if (record.document_number.empty()) {
    v.errors.emplace_back("Missing document number");
  }
  if (record.date_of_birth.size() != 6) {
    v.errors.emplace_back("Invalid date of birth");
  }
  if (record.date_of_expiry.size() != 6) {
    v.errors.emplace_back("Invalid date of expiry");
  }
  if (record.nationality.size() != 3) {
    v.errors.emplace_back("Invalid nationality code");
  }
  if (record.issuing_country.size() != 3) {
    v.errors.emplace_back("Invalid issuing country code");
  }
  if (std::find(kSexMarkers.begin(), kSexMarkers.end(), record.sex) == kSexMarkers.end()) {
    v.errors.emplace_back("Invalid sex indicator");
  }

  v.is_valid = v.errors.empty();
  return v;
}

}  // namespace docscan::mrz
