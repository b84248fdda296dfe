#include <shotocr/vision/denoise_stage.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/imgproc.hpp>

namespace shotocr::vision {

DenoiseStage::DenoiseStage(int diameter, double sigma_color, double sigma_space)
    : diameter_(diameter), sigma_color_(sigma_color), sigma_space_(sigma_space) {}

std::expected<shotocr::core::StageOutput, shotocr::core::PipelineError>
DenoiseStage::process(const shotocr::core::Frame& input) {
  using namespace shotocr::core;

  if (input.format() != PixelFormat::Grayscale8) {
    return std::unexpected(PipelineError::InvalidFrame);
  }
  auto mat_in = detail::frame_to_mat(input);
  if (!mat_in) {
    return std::unexpected(PipelineError::InvalidFrame);
  }

  // bilateralFilter does not work in place.
  cv::Mat filtered;
  cv::bilateralFilter(*mat_in, filtered, diameter_, sigma_color_, sigma_space_);
  return StageOutput{detail::mat_to_frame(filtered, PixelFormat::Grayscale8)};
}

}  // namespace shotocr::vision
