#pragma once

#include <docscan/core/frame.hpp>
#include <docscan/core/pipeline.hpp>
#include <docscan/core/qr_detection.hpp>
#include <functional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#ifdef DOCSCAN_HAS_TBB

namespace docscan::app {

/// Callback for each QrScanResult in the multi-camera TBB runner; receives result and unit_id.
/// May be invoked from TBB worker threads; must be thread-safe.
using QrScanCallbackWithUnitId =
    std::function<void(const docscan::core::QrScanResult&, const std::string& unit_id)>;

/// Scans a batch of (unit_id, frame) work items in parallel using TBB.
///
/// For each item, the pipeline registered for unit_id scans the frame; on success
/// the result's camera_id is set to unit_id and callback(result, unit_id) is invoked.
/// Items whose unit_id has no pipeline are skipped.
///
/// **One pipeline per unit:** the QR decoders are not thread-safe. Work items that
/// share a unit_id are scanned sequentially, in submission order, within one task;
/// distinct units run concurrently.
///
/// \param pipelines Map from unit_id (e.g. camera_id) to pipeline. Caller keeps ownership.
/// \param work_items Flat list of (unit_id, frame) pairs. Frames are read only.
/// \param callback Invoked for each successful result with (result, unit_id). Must be thread-safe.
void run_scan_multi_camera_tbb(
    const std::unordered_map<std::string, docscan::core::Pipeline*>& pipelines,
    const std::vector<std::pair<std::string, docscan::core::Frame>>& work_items,
    QrScanCallbackWithUnitId callback);

}  // namespace docscan::app

#endif  // DOCSCAN_HAS_TBB
