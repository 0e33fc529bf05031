/**
 * docscan-cli: decode QR codes from an image, or parse MRZ text into identity fields.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/apps/docscan-cli/docscan_cli qr --input frame.png [--policy exhaustive]
 *        ./build/apps/docscan-cli/docscan_cli qr --input a.png --input b.png   (parallel batch)
 *        ./build/apps/docscan-cli/docscan_cli mrz --text mrz.txt
 *        ./build/apps/docscan-cli/docscan_cli mrz-region --input passport.jpg [--zone mrz.png]
 * With --output: results are also written to the given file (same content as terminal).
 */

#include <docscan/app/batch_runner.hpp>
#include <docscan/app/config.hpp>
#include <docscan/app/result_writer.hpp>
#include <docscan/app/scanner.hpp>
#include <docscan/core/error.hpp>
#include <docscan/core/frame.hpp>
#include <docscan/core/qr_detection.hpp>
#include <docscan/core/scan_observer.hpp>
#include <docscan/mrz/mrz_region.hpp>
#include <docscan/mrz/mrz_validation.hpp>
#include <docscan/vision/load_image.hpp>

#include <cstdint>
#include <fstream>
#include <iostream>
#include <iterator>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

std::string event_kind_str(docscan::core::ScanEventKind k) {
  using docscan::core::ScanEventKind;
  switch (k) {
  case ScanEventKind::StandardPassDone:
    return "standard-pass";
  case ScanEventKind::GridDecodeFailed:
    return "grid-decode-failed";
  case ScanEventKind::FallbackSkipped:
    return "fallback-skipped";
  case ScanEventKind::FallbackStarted:
    return "fallback-started";
  case ScanEventKind::TileScanned:
    return "tile";
  case ScanEventKind::FallbackDone:
    return "fallback-done";
  case ScanEventKind::MrzLinesNormalized:
    return "mrz-lines";
  case ScanEventKind::MrzClassified:
    return "mrz-format";
  default:
    return "event";
  }
}

void print_event(const docscan::core::ScanEvent &e) {
  std::cerr << "[docscan] " << event_kind_str(e.kind) << " count=" << e.count;
  if (e.row >= 0) std::cerr << " region=(" << e.row << "," << e.col << ") scale=" << e.scale;
  if (!e.detail.empty()) std::cerr << " " << e.detail;
  std::cerr << "\n";
}

void print_usage() {
  std::cout << "Usage: docscan_cli <command> [options]\n"
            << "Commands:\n"
            << "  qr          Decode QR codes from an image (--input required)\n"
            << "  mrz         Parse MRZ text (--text <file>, default stdin)\n"
            << "  mrz-region  Locate the MRZ band in a document image (--input required)\n"
            << "Options:\n"
            << "  --config <path>   Scanner config (key=value file); default: built-in\n"
            << "  --input <path>    Image path (repeat for a parallel batch of QR scans)\n"
            << "  --text <path>     MRZ text file\n"
            << "  --policy <p>      Fallback policy override: first_match | exhaustive\n"
            << "  --output <path>   Also write results to this file\n"
            << "  --zone <path>     mrz-region: save the cropped, 2x upscaled zone as an image\n"
            << "  --verbose         Print scan events to stderr\n";
}

int emit(const std::string &text, const std::string &output_path) {
  std::cout << text;
  if (output_path.empty()) return 0;
  auto written = docscan::app::write_text(output_path, text);
  if (!written) {
    std::cerr << "Error: " << docscan::core::describe(written.error()) << "\n";
    return 1;
  }
  return 0;
}

int run_qr(const docscan::app::ScannerConfig &cfg, const std::vector<std::string> &input_paths,
           const std::string &output_path, docscan::core::ScanObserver observer) {
  if (input_paths.empty()) {
    std::cerr << "qr requires --input <image>\n";
    return 1;
  }
  auto valid = docscan::app::validate_config(cfg);
  if (!valid) {
    std::cerr << "Error: " << docscan::core::describe(valid.error()) << "\n";
    return 1;
  }

  std::vector<docscan::core::Frame> frames;
  frames.reserve(input_paths.size());
  for (const auto &path : input_paths) {
    auto frame = docscan::vision::load_frame_from_image(path);
    if (!frame) {
      std::cerr << "Failed to load image: " << path << "\n";
      return 1;
    }
    frames.push_back(std::move(*frame));
  }

  if (frames.size() == 1) {
    docscan::core::Pipeline pipeline =
        docscan::app::build_qr_pipeline(cfg, nullptr, std::move(observer));
    auto result = docscan::app::run_scan(pipeline, frames.front());
    if (!result) {
      std::cerr << "Error: " << docscan::core::describe(result.error()) << "\n";
      return 1;
    }
    return emit(docscan::app::format_qr_results(*result), output_path);
  }

  // One pipeline per worker; results arrive in completion order.
  const docscan::core::ScanObserver shared_observer =
      docscan::core::make_serialized_observer(std::move(observer));
  std::mutex out_mutex;
  std::vector<std::string> per_frame(frames.size());
  std::size_t failed = 0;
  docscan::app::PipelineFactory factory = [&cfg, &shared_observer]() {
    return docscan::app::build_qr_pipeline(cfg, nullptr, shared_observer);
  };
  docscan::app::run_scan_batch_parallel(
      factory, frames,
      [&](const docscan::core::QrScanResult &r) {
        std::string text = docscan::app::format_qr_results(r);
        std::lock_guard lock(out_mutex);
        per_frame[r.frame_id] = std::move(text);
      },
      cfg.num_workers, &input_paths,
      [&](std::uint64_t frame_id, const docscan::core::Error &error) {
        std::lock_guard lock(out_mutex);
        std::cerr << "Error: " << input_paths[frame_id] << ": "
                  << docscan::core::describe(error) << "\n";
        ++failed;
      });

  std::string all;
  for (const auto &text : per_frame) all += text;
  const int emitted = emit(all, output_path);
  return failed > 0 ? 1 : emitted;
}

int run_mrz(const docscan::app::ScannerConfig &cfg, const std::string &text_path,
            const std::string &output_path, docscan::core::ScanObserver observer) {
  std::string text;
  if (text_path.empty()) {
    text.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
  } else {
    std::ifstream f(text_path);
    if (!f) {
      std::cerr << "Failed to open text file: " << text_path << "\n";
      return 1;
    }
    std::ostringstream buf;
    buf << f.rdbuf();
    text = buf.str();
  }

  auto record = docscan::app::parse_mrz(text, cfg, std::move(observer));
  if (!record) {
    std::cerr << "Error: " << docscan::core::describe(record.error()) << "\n";
    return 1;
  }
  const docscan::mrz::MrzValidation validation = docscan::mrz::validate_mrz(*record);
  return emit(docscan::app::format_mrz_record(*record, &validation), output_path);
}

int run_mrz_region(const std::string &input_path, const std::string &output_path,
                   const std::string &zone_path) {
  if (input_path.empty()) {
    std::cerr << "mrz-region requires --input <image>\n";
    return 1;
  }
  auto frame = docscan::vision::load_frame_from_image(input_path);
  if (!frame) {
    std::cerr << "Failed to load image: " << input_path << "\n";
    return 1;
  }
  auto binary = docscan::mrz::preprocess_for_ocr(*frame);
  if (!binary) {
    std::cerr << "Error: " << docscan::core::describe(binary.error()) << "\n";
    return 1;
  }

  std::ostringstream out;
  const auto region = docscan::mrz::locate_mrz_region(*binary);
  if (!region) {
    out << "mrz_region none\n";
    return emit(out.str(), output_path);
  }
  out << "mrz_region x=" << region->x << " y=" << region->y << " width=" << region->width
      << " height=" << region->height << "\n";

  if (!zone_path.empty()) {
    auto zone = docscan::mrz::extract_mrz_zone(*binary, *region);
    if (!zone) {
      std::cerr << "Error: " << docscan::core::describe(zone.error()) << "\n";
      return 1;
    }
    auto saved = docscan::vision::save_frame_to_image(*zone, zone_path);
    if (!saved) {
      std::cerr << "Error: " << docscan::core::describe(saved.error()) << "\n";
      return 1;
    }
    out << "mrz_zone width=" << zone->width() << " height=" << zone->height()
        << " path=" << zone_path << "\n";
  }
  return emit(out.str(), output_path);
}

} // namespace

int main(int argc, char *argv[]) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  const std::string command = argv[1];
  if (command == "--help" || command == "-h") {
    print_usage();
    return 0;
  }

  std::string config_path;
  std::vector<std::string> input_paths;
  std::string text_path;
  std::string output_path;
  std::string policy_override;
  std::string zone_path;
  bool verbose = false;

  for (int i = 2; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--input" && i + 1 < argc) {
      input_paths.emplace_back(argv[++i]);
    } else if (arg == "--text" && i + 1 < argc) {
      text_path = argv[++i];
    } else if (arg == "--output" && i + 1 < argc) {
      output_path = argv[++i];
    } else if (arg == "--policy" && i + 1 < argc) {
      policy_override = argv[++i];
    } else if (arg == "--zone" && i + 1 < argc) {
      zone_path = argv[++i];
    } else if (arg == "--verbose") {
      verbose = true;
    } else if (arg == "--help" || arg == "-h") {
      print_usage();
      return 0;
    } else {
      std::cerr << "Unknown argument: " << arg << "\n";
      return 1;
    }
  }

  docscan::app::ScannerConfig cfg = docscan::app::default_config();
  if (!config_path.empty()) {
    try {
      cfg = docscan::app::load_config(config_path);
    } catch (const std::logic_error &e) {
      std::cerr << "Bad value in config " << config_path << ": " << e.what() << "\n";
      return 1;
    }
  }
  if (!policy_override.empty()) {
    if (policy_override == "first_match") {
      cfg.fallback_policy = docscan::qr::FallbackPolicy::StopAtFirstMatch;
    } else if (policy_override == "exhaustive") {
      cfg.fallback_policy = docscan::qr::FallbackPolicy::Exhaustive;
    } else {
      std::cerr << "Unknown --policy " << policy_override << " (use first_match or exhaustive)\n";
      return 1;
    }
  }

  docscan::core::ScanObserver observer;
  if (verbose) observer = print_event;

  if (command == "qr") return run_qr(cfg, input_paths, output_path, std::move(observer));
  if (command == "mrz") return run_mrz(cfg, text_path, output_path, std::move(observer));
  if (command == "mrz-region") return run_mrz_region(input_paths.empty() ? std::string{} : input_paths.front(), output_path,
                          zone_path);

  std::cerr << "Unknown command: " << command << "\n";
  print_usage();
  return 1;
}
