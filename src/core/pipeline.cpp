#include <docscan/core/pipeline.hpp>
#include <chrono>
#include <string>
#include <utility>

namespace docscan::core {

namespace {

double elapsed_ms(std::chrono::steady_clock::time_point start) {
  const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
      std::chrono::steady_clock::now() - start);
  return 1e-6 * static_cast<double>(ns.count());
}

QrScanResult stamped(QrScanResult result, const ScanContext& context) {
  result.frame_id = context.frame_id;
  result.camera_id = context.camera_id;
  return result;
}

}  // namespace

void Pipeline::add_stage(std::unique_ptr<IPipelineStage> stage) {
  if (stage) {
    stages_.push_back(std::move(stage));
  }
}

std::vector<std::string_view> Pipeline::stage_names() const {
  std::vector<std::string_view> names;
  names.reserve(stages_.size());
  for (const auto& stage : stages_) {
    names.push_back(stage->name());
  }
  return names;
}

std::expected<QrScanResult, Error> Pipeline::run(const Frame& input,
                                                 const ScanContext& context,
                                                 const StageTimingCallback& timing_cb) {
  // The input is only copied once a stage hands back a new frame.
  const Frame* frame = &input;
  Frame owned;

  for (std::size_t i = 0; i < stages_.size(); ++i) {
    IPipelineStage& stage = *stages_[i];
    const auto start = std::chrono::steady_clock::now();
    auto output = stage.process(*frame, context);
    if (timing_cb) {
      timing_cb(StageTiming{i, stage.name(), elapsed_ms(start)});
    }

    if (!output) {
      return std::unexpected(std::move(output.error()));
    }
    if (auto* result = std::get_if<QrScanResult>(&*output)) {
      return stamped(std::move(*result), context);
    }
    owned = std::get<Frame>(std::move(*output));
    frame = &owned;
  }

  return std::unexpected(Error{ErrorKind::InvalidConfig, 0, stages_.size(),
                               "pipeline has no result-emitting stage"});
}

}  // namespace docscan::core
