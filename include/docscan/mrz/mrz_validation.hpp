#pragma once

#include <docscan/core/mrz_record.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace docscan::mrz {

/// Field plausibility report. Check digits are not verified.
struct MrzValidation {
  bool is_valid{false};
  std::vector<std::string> errors;
};

/// "YYMMDD" -> "YYYY-MM-DD"; years above 50 map to 19xx, others to 20xx.
/// Input that is not six characters is returned unchanged.
[[nodiscard]] std::string format_mrz_date(std::string_view mrz_date);

/// Checks presence and length of the identifying fields and the sex marker.
[[nodiscard]] MrzValidation validate_mrz(const docscan::core::MrzRecord& record);

}  // namespace docscan::mrz
