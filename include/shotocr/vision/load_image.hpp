#pragma once

#include <shotocr/core/error.hpp>
#include <shotocr/core/frame.hpp>
#include <cstddef>
#include <expected>
#include <span>
#include <string>

namespace shotocr::vision {

/// Decode an image file (any format imgcodecs reads) into a BGR8 Frame.
/// Returns ImageDecodeError if the file is missing or cannot be decoded.
[[nodiscard]] std::expected<shotocr::core::Frame, shotocr::core::PipelineError>
load_frame_from_file(const std::string& path);

/// Decode encoded image bytes (JPEG, PNG, ...) into a BGR8 Frame.
/// Returns ImageDecodeError for empty or undecodable input.
[[nodiscard]] std::expected<shotocr::core::Frame, shotocr::core::PipelineError>
load_frame_from_bytes(std::span<const std::byte> encoded);

}  // namespace shotocr::vision
