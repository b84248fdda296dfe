#include <shotocr/ocr/shot_recognition_stage.hpp>
#include <shotocr/core/shot_reading.hpp>
#include <optional>
#include <stdexcept>

namespace shotocr::ocr {

ShotRecognitionStage::ShotRecognitionStage(std::unique_ptr<IOcrEngine> engine,
                                           shotocr::core::DisplayType display)
    : engine_(std::move(engine)),
      display_(display),
      layout_(shotocr::core::layout_for(display)) {
  if (!engine_) {
    throw std::invalid_argument("ShotRecognitionStage: engine must not be null");
  }
}

std::expected<shotocr::core::StageOutput, shotocr::core::PipelineError>
ShotRecognitionStage::process(const shotocr::core::Frame& input) {
  auto valid = engine_->validate_input(input);
  if (!valid) {
    return std::unexpected(valid.error());
  }
  auto text = engine_->recognize(input);
  if (!text) {
    return std::unexpected(text.error());
  }
  return shotocr::core::StageOutput{read_text(std::move(*text))};
}

shotocr::core::ShotReading ShotRecognitionStage::read_text(std::string raw_text) const {
  const NumericSequence numbers = extractor_.extract(raw_text);
  shotocr::core::FieldMap fields = mapper_.map(numbers, layout_);

  std::size_t populated = 0;
  for (const auto& f : fields) {
    if (f.value) ++populated;
  }
  const double confidence = scorer_.score(populated, layout_.size());

  std::optional<std::string> note;
  if (populated < layout_.size()) {
    note = "insufficient data: " + std::to_string(populated) + " of " +
           std::to_string(layout_.size()) + " fields recognized";
  }
  return shotocr::core::ShotReading(display_, std::move(fields), confidence,
                                    std::move(raw_text), std::move(note));
}

}  // namespace shotocr::ocr
