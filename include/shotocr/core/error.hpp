#pragma once

#include <string_view>

namespace shotocr::core {

/// Pipeline error codes; used with std::expected for per-image failures.
/// Insufficient data is not an error: it shows up as null fields and low confidence.
enum class PipelineError {
  None = 0,
  ImageDecodeError,  // input bytes/file could not be decoded
  OcrEngineError,    // recognizer unavailable or failed
  InvalidFrame,      // empty or unsupported pixel format for a stage
  InvalidConfig,     // pipeline has no terminal stage
};

/// Stable name for logs and CLI output (e.g. "ImageDecodeError").
[[nodiscard]] std::string_view error_name(PipelineError error) noexcept;

}  // namespace shotocr::core
