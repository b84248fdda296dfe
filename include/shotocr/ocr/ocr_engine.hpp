#pragma once

#include <shotocr/core/error.hpp>
#include <shotocr/core/frame.hpp>
#include <expected>
#include <span>
#include <string>
#include <vector>

namespace shotocr::ocr {

/// Abstract text recognizer: preprocessed Grayscale8 Frame -> raw text.
/// Implement recognize(); optionally override validate_input and recognize_batch.
/// Instances are not required to be thread-safe; use one engine per pipeline.
class IOcrEngine {
 public:
  virtual ~IOcrEngine() = default;

  /// Raw recognized text (possibly empty), or OcrEngineError. Must be implemented.
  [[nodiscard]] virtual std::expected<std::string, shotocr::core::PipelineError>
  recognize(const shotocr::core::Frame& input) = 0;

  /// Default: reject empty frames and anything other than Grayscale8 with InvalidFrame.
  [[nodiscard]] virtual std::expected<void, shotocr::core::PipelineError>
  validate_input(const shotocr::core::Frame& input) const;

  /// Default: loop over recognize(); stops at the first failure.
  [[nodiscard]] virtual std::expected<std::vector<std::string>, shotocr::core::PipelineError>
  recognize_batch(std::span<const shotocr::core::Frame> inputs);
};

}  // namespace shotocr::ocr
