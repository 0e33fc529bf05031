#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

namespace docscan::core {

/// Progress notifications emitted by the QR and MRZ pipelines.
enum class ScanEventKind : std::uint8_t {
  StandardPassDone,   // count = detections
  GridDecodeFailed,   // row/col/scale set when inside the fallback
  FallbackSkipped,    // frame below minimum dimension or fallback disabled
  FallbackStarted,
  TileScanned,        // row, col, scale, count = new unique detections
  FallbackDone,       // count = detections
  MrzLinesNormalized, // count = surviving lines
  MrzClassified,      // detail = format name
};

struct ScanEvent {
  ScanEventKind kind{ScanEventKind::StandardPassDone};
  std::size_t count{0};
  int row{-1};
  int col{-1};
  float scale{0.f};
  std::string detail;
};

/// Observer invoked synchronously from the scanning thread. Empty = no-op.
/// An observer shared by pipelines on different threads must be thread-safe;
/// wrap it with make_serialized_observer().
using ScanObserver = std::function<void(const ScanEvent&)>;

/// Calls observer if set.
inline void notify(const ScanObserver& observer, const ScanEvent& event) {
  if (observer) observer(event);
}

/// Wraps observer so that concurrent calls run one at a time. Copies of the
/// returned observer share one lock. Empty in, empty out.
[[nodiscard]] inline ScanObserver make_serialized_observer(ScanObserver observer) {
  if (!observer) return {};
  auto lock = std::make_shared<std::mutex>();
  return [inner = std::move(observer), lock](const ScanEvent& event) {
    std::lock_guard guard(*lock);
    inner(event);
  };
}

}  // namespace docscan::core
