#include <docscan/app/config.hpp>
#include <fstream>
#include <sstream>
#include <string_view>

namespace docscan::app {

namespace {

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end == std::string::npos ? std::string::npos : end - start + 1);
}

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key.assign(line.substr(0, pos));
  value.assign(line.substr(pos + 1));
  trim(key);
  trim(value);
  return !key.empty();
}

bool parse_bool(const std::string& value, bool fallback) {
  if (value == "true" || value == "1" || value == "on") return true;
  if (value == "false" || value == "0" || value == "off") return false;
  return fallback;
}

std::vector<float> parse_scales(const std::string& value) {
  std::vector<float> scales;
  std::istringstream in(value);
  std::string item;
  while (std::getline(in, item, ',')) {
    trim(item);
    if (!item.empty()) scales.push_back(std::stof(item));
  }
  return scales;
}

}  // namespace

ScannerConfig default_config() {
  ScannerConfig c;
  c.fallback_enabled = true;
  c.fallback_policy = qr::FallbackPolicy::StopAtFirstMatch;
  c.fallback_min_dimension = qr::kFallbackMinDimension;
  c.fallback_scales.assign(qr::kFallbackScales.begin(), qr::kFallbackScales.end());
  c.mrz_min_line_length = 20;
  c.num_workers = 0;
  return c;
}

ScannerConfig load_config(const std::string& path) {
  ScannerConfig c = default_config();
  std::ifstream f(path);
  if (!f) return c;

  std::string line;
  std::string key;
  std::string value;
  while (std::getline(f, line)) {
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) continue;

    if (key == "fallback_enabled") c.fallback_enabled = parse_bool(value, c.fallback_enabled);
    else if (key == "fallback_policy") {
      if (value == "exhaustive") c.fallback_policy = qr::FallbackPolicy::Exhaustive;
      else if (value == "first_match") c.fallback_policy = qr::FallbackPolicy::StopAtFirstMatch;
    }
    else if (key == "fallback_min_dimension") c.fallback_min_dimension = static_cast<std::uint32_t>(std::stoul(value));
    else if (key == "fallback_scales") c.fallback_scales = parse_scales(value);
    else if (key == "mrz_min_line_length") c.mrz_min_line_length = std::stoul(value);
    else if (key == "num_workers") c.num_workers = std::stoul(value);
  }
  return c;
}

std::expected<void, docscan::core::Error> validate_config(const ScannerConfig& config) {
  using docscan::core::Error;
  using docscan::core::ErrorKind;
  if (config.fallback_scales.empty()) {
    return std::unexpected(Error{ErrorKind::InvalidConfig, 0, 0, "fallback_scales is empty"});
  }
  for (const float s : config.fallback_scales) {
    if (!(s > 0.f)) {
      return std::unexpected(
          Error{ErrorKind::InvalidConfig, 0, 0, "fallback_scales must be positive"});
    }
  }
  return {};
}

qr::QrDetectionOptions to_detection_options(const ScannerConfig& config) {
  qr::QrDetectionOptions o;
  o.fallback_enabled = config.fallback_enabled;
  o.policy = config.fallback_policy;
  o.fallback_min_dimension = config.fallback_min_dimension;
  o.fallback_scales = config.fallback_scales;
  return o;
}

}  // namespace docscan::app
