#include <shotocr/ocr/ocr_engine.hpp>
#include <shotocr/core/error.hpp>
#include <span>
#include <vector>

namespace shotocr::ocr {

std::expected<void, shotocr::core::PipelineError>
IOcrEngine::validate_input(const shotocr::core::Frame& input) const {
  if (input.empty() || input.format() != shotocr::core::PixelFormat::Grayscale8) {
    return std::unexpected(shotocr::core::PipelineError::InvalidFrame);
  }
  return {};
}

std::expected<std::vector<std::string>, shotocr::core::PipelineError>
IOcrEngine::recognize_batch(std::span<const shotocr::core::Frame> inputs) {
  std::vector<std::string> texts;
  texts.reserve(inputs.size());
  for (const auto& frame : inputs) {
    auto single = recognize(frame);
    if (!single) {
      return std::unexpected(single.error());
    }
    texts.push_back(std::move(*single));
  }
  return texts;
}

}  // namespace shotocr::ocr
