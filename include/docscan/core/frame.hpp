#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace docscan::core {

/// Memory: Frame owns a single contiguous buffer (std::vector<std::byte>);
/// move semantics and RAII throughout. Use data() for std::span views (non-owning).
/// Thread-safety: distinct Frame instances are independent; sharing one Frame
/// across threads requires external synchronization.

/// Pixel layout / format. Rows are tightly packed (no padding).
enum class PixelFormat : std::uint8_t {
  Unknown,
  Grayscale8,
  RGB8,
  BGR8,
  RGBA8,
  BGRA8,
};

/// Single image or video frame: dimensions, format, and owned buffer.
class Frame {
 public:
  Frame() = default;

  Frame(std::uint32_t width,
        std::uint32_t height,
        PixelFormat format,
        std::vector<std::byte> buffer)
      : width_(width),
        height_(height),
        format_(format),
        buffer_(std::move(buffer)) {}

  [[nodiscard]] std::uint32_t width() const noexcept { return width_; }
  [[nodiscard]] std::uint32_t height() const noexcept { return height_; }
  [[nodiscard]] PixelFormat format() const noexcept { return format_; }

  [[nodiscard]] std::span<std::byte> data() noexcept {
    return std::span<std::byte>(buffer_.data(), buffer_.size());
  }
  [[nodiscard]] std::span<const std::byte> data() const noexcept {
    return std::span<const std::byte>(buffer_.data(), buffer_.size());
  }

  [[nodiscard]] bool empty() const noexcept { return buffer_.empty(); }
  [[nodiscard]] std::size_t size_bytes() const noexcept { return buffer_.size(); }

  /// Value at (x, y) of a Grayscale8 frame. No bounds check.
  [[nodiscard]] std::uint8_t luma_at(std::uint32_t x, std::uint32_t y) const noexcept {
    return static_cast<std::uint8_t>(
        buffer_[static_cast<std::size_t>(y) * width_ + x]);
  }

  /// Exact byte count for given dimensions and format (0 for Unknown).
  [[nodiscard]] static std::size_t expected_bytes(std::uint32_t width,
                                                  std::uint32_t height,
                                                  PixelFormat format);

  /// Bytes per pixel for format (0 for Unknown).
  [[nodiscard]] static std::size_t channels(PixelFormat format) noexcept;

 private:
  std::uint32_t width_{0};
  std::uint32_t height_{0};
  PixelFormat format_{PixelFormat::Unknown};
  std::vector<std::byte> buffer_;
};

}  // namespace docscan::core
