#pragma once

#include <docscan/core/error.hpp>
#include <docscan/core/frame.hpp>
#include <expected>
#include <optional>
#include <string>

namespace docscan::vision {

/// Load an image file into an RGBA8 Frame. Returns nullopt on failure.
std::optional<docscan::core::Frame> load_frame_from_image(const std::string& path);

/// Write a frame to an image file; the encoder is chosen by the path extension.
/// SerializationFailed (detail = path) when the frame cannot be encoded or written.
[[nodiscard]] std::expected<void, docscan::core::Error> save_frame_to_image(
    const docscan::core::Frame& frame, const std::string& path);

}  // namespace docscan::vision
