#include <docscan/app/result_writer.hpp>
#include <docscan/mrz/mrz_validation.hpp>
#include <fstream>
#include <sstream>
#include <system_error>

namespace docscan::app {

namespace dc = docscan::core;

namespace {

std::string_view pass_str(dc::ScanPass pass) {
  switch (pass) {
    case dc::ScanPass::Standard:
      return "standard";
    case dc::ScanPass::Fallback:
      return "fallback";
    case dc::ScanPass::None:
    default:
      return "none";
  }
}

}  // namespace

std::string format_qr_results(const dc::QrScanResult& result) {
  std::ostringstream out;
  out << "frame_id=" << result.frame_id << " codes=" << result.detections.size()
      << " pass=" << pass_str(result.pass);
  if (result.camera_id.has_value()) out << " camera_id=" << *result.camera_id;
  out << "\n";
  for (const auto& d : result.detections) {
    out << "  payload=\"" << d.payload << "\" version=" << d.version << " bounds=";
    for (std::size_t i = 0; i < d.bounds.size(); ++i) {
      if (i > 0) out << ' ';
      out << '(' << d.bounds[i].x << ',' << d.bounds[i].y << ')';
    }
    out << "\n";
  }
  return out.str();
}

std::string format_mrz_record(const dc::MrzRecord& record,
                              const mrz::MrzValidation* validation) {
  std::ostringstream out;
  out << "document_type=" << dc::to_string(record.format) << "\n"
      << "document_number=" << record.document_number << "\n"
      << "issuing_country=" << record.issuing_country << "\n"
      << "nationality=" << record.nationality << "\n"
      << "surname=" << record.surname << "\n"
      << "given_names=" << record.given_names << "\n"
      << "sex=" << record.sex << "\n"
      << "date_of_birth=" << mrz::format_mrz_date(record.date_of_birth) << "\n"
      << "date_of_expiry=" << mrz::format_mrz_date(record.date_of_expiry) << "\n"
      << "optional_data=" << record.optional_data << "\n"
      << "confidence=" << record.confidence << "\n";
  for (const auto& line : record.raw_lines) {
    out << "  " << line << "\n";
  }
  if (validation) {
    out << "valid=" << (validation->is_valid ? "true" : "false") << "\n";
    for (const auto& e : validation->errors) {
      out << "  error: " << e << "\n";
    }
  }
  return out.str();
}

std::expected<void, dc::Error> write_text(const std::filesystem::path& path,
                                          std::string_view text) {
  const dc::Error failure{dc::ErrorKind::SerializationFailed, 0, 0, path.string()};

  if (path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) return std::unexpected(failure);
  }

  std::ofstream f(path, std::ios::binary | std::ios::trunc);
  if (!f) return std::unexpected(failure);
  f.write(text.data(), static_cast<std::streamsize>(text.size()));
  f.flush();
  if (!f) return std::unexpected(failure);
  return {};
}

}  // namespace docscan::app
