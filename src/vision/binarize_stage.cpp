#include <shotocr/vision/binarize_stage.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/imgproc.hpp>
#include <stdexcept>

namespace shotocr::vision {

BinarizeStage::BinarizeStage(int block_size, double offset, int kernel_size)
    : block_size_(block_size), offset_(offset), kernel_size_(kernel_size) {
  if (block_size_ < 3 || block_size_ % 2 == 0) {
    throw std::invalid_argument("BinarizeStage: threshold block size must be odd and >= 3");
  }
  if (kernel_size_ < 1) {
    throw std::invalid_argument("BinarizeStage: morphology kernel size must be >= 1");
  }
}

std::expected<shotocr::core::StageOutput, shotocr::core::PipelineError>
BinarizeStage::process(const shotocr::core::Frame& input) {
  using namespace shotocr::core;

  if (input.format() != PixelFormat::Grayscale8) {
    return std::unexpected(PipelineError::InvalidFrame);
  }
  auto mat_in = detail::frame_to_mat(input);
  if (!mat_in) {
    return std::unexpected(PipelineError::InvalidFrame);
  }

  cv::Mat binary;
  cv::adaptiveThreshold(*mat_in, binary, 255, cv::ADAPTIVE_THRESH_GAUSSIAN_C,
                        cv::THRESH_BINARY, block_size_, offset_);

  const cv::Mat kernel = cv::Mat::ones(kernel_size_, kernel_size_, CV_8U);
  cv::Mat closed;
  cv::morphologyEx(binary, closed, cv::MORPH_CLOSE, kernel);

  return StageOutput{detail::mat_to_frame(closed, PixelFormat::Grayscale8)};
}

}  // namespace shotocr::vision
