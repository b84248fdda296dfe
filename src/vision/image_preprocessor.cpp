#include <shotocr/vision/image_preprocessor.hpp>
#include <shotocr/vision/binarize_stage.hpp>
#include <shotocr/vision/denoise_stage.hpp>
#include <shotocr/vision/grayscale_stage.hpp>
#include <shotocr/vision/upscale_stage.hpp>

namespace shotocr::vision {

ImagePreprocessor::ImagePreprocessor(const PreprocessConfig& config)
    : config_(config) {
  steps_.push_back(std::make_unique<GrayscaleStage>());
  steps_.push_back(std::make_unique<DenoiseStage>(
      config_.bilateral_diameter, config_.bilateral_sigma_color,
      config_.bilateral_sigma_space));
  steps_.push_back(std::make_unique<BinarizeStage>(
      config_.threshold_block_size, config_.threshold_offset,
      config_.morph_kernel_size));
  steps_.push_back(std::make_unique<UpscaleStage>(config_.min_height));
}

std::expected<shotocr::core::Frame, shotocr::core::PipelineError>
ImagePreprocessor::preprocess(const shotocr::core::Frame& input) {
  using namespace shotocr::core;

  if (input.empty()) {
    return std::unexpected(PipelineError::InvalidFrame);
  }

  Frame current = input;
  for (auto& step : steps_) {
    auto result = step->process(current);
    if (!result) {
      return std::unexpected(result.error());
    }
    auto* next = std::get_if<Frame>(&*result);
    if (!next) {
      return std::unexpected(PipelineError::InvalidConfig);
    }
    current = std::move(*next);
  }
  return current;
}

std::expected<shotocr::core::StageOutput, shotocr::core::PipelineError>
ImagePreprocessor::process(const shotocr::core::Frame& input) {
  auto frame = preprocess(input);
  if (!frame) {
    return std::unexpected(frame.error());
  }
  return shotocr::core::StageOutput{std::move(*frame)};
}

}  // namespace shotocr::vision
