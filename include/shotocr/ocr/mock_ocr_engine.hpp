#pragma once

#include <shotocr/ocr/ocr_engine.hpp>
#include <cstddef>
#include <string>

namespace shotocr::ocr {

/// Mock recognizer that returns configurable text or a configurable failure (for tests/demo).
class MockOcrEngine : public IOcrEngine {
 public:
  MockOcrEngine() = default;
  explicit MockOcrEngine(std::string text) : text_(std::move(text)) {}

  /// Text to return on the next recognize() call(s).
  void set_text(std::string text);

  /// When true, recognize() fails with OcrEngineError.
  void set_fail(bool fail) noexcept { fail_ = fail; }

  [[nodiscard]] std::expected<std::string, shotocr::core::PipelineError>
  recognize(const shotocr::core::Frame& input) override;

  [[nodiscard]] std::size_t call_count() const noexcept { return calls_; }

 private:
  std::string text_;
  bool fail_{false};
  std::size_t calls_{0};
};

}  // namespace shotocr::ocr
