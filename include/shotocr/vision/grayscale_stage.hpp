#pragma once

#include <shotocr/core/error.hpp>
#include <shotocr/core/frame.hpp>
#include <shotocr/core/pipeline_stage.hpp>
#include <expected>

namespace shotocr::vision {

/// Converts any 8-bit color frame (BGR/RGB, with or without alpha) to Grayscale8.
/// Grayscale input is copied through unchanged.
class GrayscaleStage : public shotocr::core::IPipelineStage {
 public:
  GrayscaleStage() = default;

  [[nodiscard]] std::expected<shotocr::core::StageOutput,
                              shotocr::core::PipelineError>
  process(const shotocr::core::Frame& input) override;
};

}  // namespace shotocr::vision
