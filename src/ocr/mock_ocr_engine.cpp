#include <shotocr/ocr/mock_ocr_engine.hpp>
#include <shotocr/core/error.hpp>

namespace shotocr::ocr {

void MockOcrEngine::set_text(std::string text) { text_ = std::move(text); }

std::expected<std::string, shotocr::core::PipelineError>
MockOcrEngine::recognize(const shotocr::core::Frame& /*input*/) {
  ++calls_;
  if (fail_) {
    return std::unexpected(shotocr::core::PipelineError::OcrEngineError);
  }
  return text_;
}

}  // namespace shotocr::ocr
