#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace docscan::core {

/// ICAO 9303 layouts: TD1 ID cards, TD2 official documents, TD3 passports.
enum class MrzFormat : std::uint8_t {
  TD1,
  TD2,
  TD3,
};

/// Fields extracted from one machine-readable zone.
struct MrzRecord {
  MrzFormat format{MrzFormat::TD3};
  std::string document_number;
  std::string issuing_country;
  std::string nationality;
  std::string sex;
  std::string date_of_birth;   // YYMMDD
  std::string date_of_expiry;  // YYMMDD
  std::string surname;
  std::string given_names;
  std::string optional_data;
  std::vector<std::string> raw_lines;  // width-fitted lines used for extraction
  float confidence{0.f};
};

[[nodiscard]] constexpr std::string_view to_string(MrzFormat f) noexcept {
  switch (f) {
    case MrzFormat::TD1:
      return "TD1";
    case MrzFormat::TD2:
      return "TD2";
    case MrzFormat::TD3:
      return "TD3";
  }
  return "Unknown";
}

}  // namespace docscan::core
