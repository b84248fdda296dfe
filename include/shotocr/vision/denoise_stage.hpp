#pragma once

#include <shotocr/core/error.hpp>
#include <shotocr/core/frame.hpp>
#include <shotocr/core/pipeline_stage.hpp>
#include <expected>

namespace shotocr::vision {

/// Edge-preserving bilateral smoothing of a Grayscale8 frame.
/// Suppresses sensor and JPEG noise without blurring digit strokes.
class DenoiseStage : public shotocr::core::IPipelineStage {
 public:
  DenoiseStage(int diameter, double sigma_color, double sigma_space);

  [[nodiscard]] std::expected<shotocr::core::StageOutput,
                              shotocr::core::PipelineError>
  process(const shotocr::core::Frame& input) override;

 private:
  int diameter_;
  double sigma_color_;
  double sigma_space_;
};

}  // namespace shotocr::vision
