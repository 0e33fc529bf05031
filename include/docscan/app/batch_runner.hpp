#pragma once

#include <docscan/core/error.hpp>
#include <docscan/core/frame.hpp>
#include <docscan/core/pipeline.hpp>
#include <docscan/core/qr_detection.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace docscan::app {

/// Callback for each QrScanResult; may be invoked from worker threads.
/// Must be thread-safe if using run_scan_batch_parallel.
using QrScanCallback = std::function<void(const docscan::core::QrScanResult&)>;

/// Callback for each frame whose scan failed: (frame index, error).
/// Same threading rules as QrScanCallback.
using QrScanErrorCallback =
    std::function<void(std::uint64_t frame_id, const docscan::core::Error&)>;

/// Builds an independent pipeline; called once per worker thread.
using PipelineFactory = std::function<docscan::core::Pipeline()>;

/// Optional per-stage timing. Pass to run_scan to get timings.
using StageTimingCallback = docscan::core::StageTimingCallback;

/// Runs pipeline on a single frame. No threading; direct call.
/// If camera_id is provided, it is set on the returned QrScanResult for traceability.
[[nodiscard]] std::expected<docscan::core::QrScanResult, docscan::core::Error>
run_scan(docscan::core::Pipeline& pipeline,
         const docscan::core::Frame& frame,
         const StageTimingCallback& timing_cb = {},
         std::optional<std::string> camera_id = std::nullopt);

/// Runs pipeline on multiple frames sequentially; calls callback for each successful result
/// with frame_id set to the frame's index. Failed frames (e.g. bad buffer) go to on_error
/// when given and are skipped otherwise.
/// If camera_ids is provided (same size as frames), each result is tagged; empty string = leave unset.
void run_scan_batch(docscan::core::Pipeline& pipeline,
                    const std::vector<docscan::core::Frame>& frames,
                    QrScanCallback callback,
                    const std::vector<std::string>* camera_ids = nullptr,
                    QrScanErrorCallback on_error = {});

/// Runs frames in parallel on a pool of std::thread workers, each with its own
/// pipeline from factory. Callbacks may be invoked from any worker (must be thread-safe);
/// results arrive in completion order, frame_id identifies the input index.
/// num_workers 0 = use hardware concurrency.
void run_scan_batch_parallel(const PipelineFactory& factory,
                             const std::vector<docscan::core::Frame>& frames,
                             QrScanCallback callback,
                             std::size_t num_workers = 0,
                             const std::vector<std::string>* camera_ids = nullptr,
                             QrScanErrorCallback on_error = {});

}  // namespace docscan::app
