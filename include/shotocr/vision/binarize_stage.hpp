#pragma once

#include <shotocr/core/error.hpp>
#include <shotocr/core/frame.hpp>
#include <shotocr/core/pipeline_stage.hpp>
#include <expected>

namespace shotocr::vision {

/// Adaptive (Gaussian-weighted local mean) binarization followed by a morphological
/// closing that reconnects strokes broken by thresholding. Input and output: Grayscale8,
/// output pixels are 0 or 255.
class BinarizeStage : public shotocr::core::IPipelineStage {
 public:
  /// Throws std::invalid_argument if block_size is not odd and >= 3, or kernel_size < 1.
  BinarizeStage(int block_size, double offset, int kernel_size);

  [[nodiscard]] std::expected<shotocr::core::StageOutput,
                              shotocr::core::PipelineError>
  process(const shotocr::core::Frame& input) override;

 private:
  int block_size_;
  double offset_;
  int kernel_size_;
};

}  // namespace shotocr::vision
