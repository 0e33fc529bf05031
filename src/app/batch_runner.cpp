#include <docscan/app/batch_runner.hpp>
#include <algorithm>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace docscan::app {

namespace {

docscan::core::ScanContext context_for(std::size_t index,
                                       const std::vector<std::string>* camera_ids) {
  docscan::core::ScanContext context;
  context.frame_id = index;
  if (camera_ids && index < camera_ids->size() && !(*camera_ids)[index].empty()) {
    context.camera_id = (*camera_ids)[index];
  }
  return context;
}

/// Scans frames[index] and routes the outcome to the matching callback.
void scan_one(docscan::core::Pipeline& pipeline,
              const std::vector<docscan::core::Frame>& frames,
              std::size_t index,
              const std::vector<std::string>* camera_ids,
              const QrScanCallback& callback,
              const QrScanErrorCallback& on_error) {
  auto result = pipeline.run(frames[index], context_for(index, camera_ids));
  if (result) {
    callback(*result);
  } else if (on_error) {
    on_error(index, result.error());
  }
}

std::size_t effective_workers(std::size_t num_workers) {
  if (num_workers > 0) return num_workers;
  const unsigned hw = std::thread::hardware_concurrency();
  return hw > 0 ? static_cast<std::size_t>(hw) : 1;
}

}  // namespace

std::expected<docscan::core::QrScanResult, docscan::core::Error>
run_scan(docscan::core::Pipeline& pipeline,
         const docscan::core::Frame& frame,
         const StageTimingCallback& timing_cb,
         std::optional<std::string> camera_id) {
  docscan::core::ScanContext context;
  context.camera_id = std::move(camera_id);
  return pipeline.run(frame, context, timing_cb);
}

void run_scan_batch(docscan::core::Pipeline& pipeline,
                    const std::vector<docscan::core::Frame>& frames,
                    QrScanCallback callback,
                    const std::vector<std::string>* camera_ids,
                    QrScanErrorCallback on_error) {
  if (!callback) return;
  if (camera_ids && camera_ids->size() != frames.size()) camera_ids = nullptr;
  for (std::size_t i = 0; i < frames.size(); ++i) {
    scan_one(pipeline, frames, i, camera_ids, callback, on_error);
  }
}

void run_scan_batch_parallel(const PipelineFactory& factory,
                             const std::vector<docscan::core::Frame>& frames,
                             QrScanCallback callback,
                             std::size_t num_workers,
                             const std::vector<std::string>* camera_ids,
                             QrScanErrorCallback on_error) {
  const std::size_t n = frames.size();
  if (n == 0 || !callback || !factory) return;
  if (camera_ids && camera_ids->size() != n) camera_ids = nullptr;

  const std::size_t workers = std::min(effective_workers(num_workers), n);
  if (workers <= 1) {
    docscan::core::Pipeline pipeline = factory();
    run_scan_batch(pipeline, frames, std::move(callback), camera_ids, std::move(on_error));
    return;
  }

  std::queue<std::size_t> index_queue;
  for (std::size_t i = 0; i < n; ++i) {
    index_queue.push(i);
  }
  std::mutex queue_mutex;

  auto worker = [&]() {
    docscan::core::Pipeline pipeline = factory();
    while (true) {
      std::size_t idx;
      {
        std::lock_guard lock(queue_mutex);
        if (index_queue.empty()) break;
        idx = index_queue.front();
        index_queue.pop();
      }
      scan_one(pipeline, frames, idx, camera_ids, callback, on_error);
    }
  };

  std::vector<std::thread> threads;
  threads.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    threads.emplace_back(worker);
  }

  for (auto& t : threads) {
    t.join();
  }
}

}  // namespace docscan::app
