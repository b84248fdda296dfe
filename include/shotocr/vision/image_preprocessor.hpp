#pragma once

#include <shotocr/core/error.hpp>
#include <shotocr/core/frame.hpp>
#include <shotocr/core/pipeline_stage.hpp>
#include <shotocr/vision/preprocess_config.hpp>
#include <expected>
#include <memory>
#include <vector>

namespace shotocr::vision {

/// Photograph -> recognizer-ready single-channel binary image.
///
/// Runs, in order: grayscale conversion, bilateral denoise, adaptive binarization with
/// morphological closing, and upscaling to PreprocessConfig::min_height when shorter.
/// Deterministic and stateless across calls; usable on its own or as a pipeline stage.
class ImagePreprocessor : public shotocr::core::IPipelineStage {
 public:
  /// Throws std::invalid_argument for an unusable config (see BinarizeStage).
  explicit ImagePreprocessor(const PreprocessConfig& config = {});

  /// Returns the preprocessed Grayscale8 frame, or InvalidFrame for empty/unsupported input.
  [[nodiscard]] std::expected<shotocr::core::Frame, shotocr::core::PipelineError>
  preprocess(const shotocr::core::Frame& input);

  [[nodiscard]] std::expected<shotocr::core::StageOutput,
                              shotocr::core::PipelineError>
  process(const shotocr::core::Frame& input) override;

  [[nodiscard]] const PreprocessConfig& config() const noexcept { return config_; }

 private:
  PreprocessConfig config_;
  std::vector<std::unique_ptr<shotocr::core::IPipelineStage>> steps_;
};

}  // namespace shotocr::vision
