#pragma once

#include <shotocr/core/display_layout.hpp>
#include <shotocr/core/error.hpp>
#include <shotocr/core/frame.hpp>
#include <shotocr/core/pipeline_stage.hpp>
#include <shotocr/core/shot_reading.hpp>
#include <shotocr/ocr/confidence_scorer.hpp>
#include <shotocr/ocr/layout_field_mapper.hpp>
#include <shotocr/ocr/numeric_token_extractor.hpp>
#include <shotocr/ocr/ocr_engine.hpp>
#include <expected>
#include <memory>
#include <string>

namespace shotocr::ocr {

/// Pipeline stage: OCR engine + extractor + mapper + scorer -> ShotReading.
class ShotRecognitionStage : public shotocr::core::IPipelineStage {
 public:
  ShotRecognitionStage(std::unique_ptr<IOcrEngine> engine,
                       shotocr::core::DisplayType display);

  [[nodiscard]] std::expected<shotocr::core::StageOutput,
                              shotocr::core::PipelineError>
  process(const shotocr::core::Frame& input) override;

  /// Text-only half of the stage: raw OCR text -> ShotReading for this stage's display.
  [[nodiscard]] shotocr::core::ShotReading read_text(std::string raw_text) const;

  [[nodiscard]] shotocr::core::DisplayType display() const noexcept { return display_; }

 private:
  std::unique_ptr<IOcrEngine> engine_;
  shotocr::core::DisplayType display_;
  const shotocr::core::DisplayLayout& layout_;
  NumericTokenExtractor extractor_;
  LayoutFieldMapper mapper_;
  ConfidenceScorer scorer_;
};

}  // namespace shotocr::ocr
