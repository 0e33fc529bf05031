#include <docscan/app/batch_runner_tbb.hpp>

#ifdef DOCSCAN_HAS_TBB

#include <docscan/core/pipeline.hpp>
#include <docscan/core/qr_detection.hpp>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <cstddef>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace docscan::app {

void run_scan_multi_camera_tbb(
    const std::unordered_map<std::string, docscan::core::Pipeline*>& pipelines,
    const std::vector<std::pair<std::string, docscan::core::Frame>>& work_items,
    QrScanCallbackWithUnitId callback) {
  if (work_items.empty() || !callback) return;

  // Group items per unit so a pipeline is never entered from two threads.
  std::vector<std::string> units;
  std::unordered_map<std::string, std::vector<std::size_t>> items_by_unit;
  for (std::size_t i = 0; i < work_items.size(); ++i) {
    const std::string& unit_id = work_items[i].first;
    if (pipelines.find(unit_id) == pipelines.end()) continue;
    auto [it, inserted] = items_by_unit.try_emplace(unit_id);
    if (inserted) units.push_back(unit_id);
    it->second.push_back(i);
  }

  tbb::parallel_for(
      tbb::blocked_range<std::size_t>(0, units.size()),
      [&](const tbb::blocked_range<std::size_t>& range) {
        for (std::size_t u = range.begin(); u != range.end(); ++u) {
          const std::string& unit_id = units[u];
          docscan::core::Pipeline* pipeline = pipelines.at(unit_id);
          for (const std::size_t i : items_by_unit.at(unit_id)) {
            docscan::core::ScanContext context;
            context.frame_id = i;
            context.camera_id = unit_id;
            auto result = pipeline->run(work_items[i].second, context);
            if (result) {
              callback(*result, unit_id);
            }
          }
        }
      });
}

}  // namespace docscan::app

#endif  // DOCSCAN_HAS_TBB
