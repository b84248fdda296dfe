#include <shotocr/vision/grayscale_stage.hpp>
#include "frame_cv_utils.hpp"
#include <shotocr/core/error.hpp>
#include <shotocr/core/frame.hpp>
#include <opencv2/imgproc.hpp>
#include <vector>

namespace shotocr::vision {

std::expected<shotocr::core::StageOutput, shotocr::core::PipelineError>
GrayscaleStage::process(const shotocr::core::Frame& input) {
  using namespace shotocr::core;

  auto mat_in = detail::frame_to_mat(input);
  if (!mat_in) {
    return std::unexpected(PipelineError::InvalidFrame);
  }

  if (input.format() == PixelFormat::Grayscale8) {
    std::vector<std::byte> buf(input.data().begin(), input.data().end());
    return StageOutput{
        Frame(input.width(), input.height(), PixelFormat::Grayscale8, std::move(buf))};
  }

  int code = -1;
  switch (input.format()) {
    case PixelFormat::BGR8:
      code = cv::COLOR_BGR2GRAY;
      break;
    case PixelFormat::RGB8:
      code = cv::COLOR_RGB2GRAY;
      break;
    case PixelFormat::BGRA8:
      code = cv::COLOR_BGRA2GRAY;
      break;
    case PixelFormat::RGBA8:
      code = cv::COLOR_RGBA2GRAY;
      break;
    default:
      return std::unexpected(PipelineError::InvalidFrame);
  }

  cv::Mat gray;
  cv::cvtColor(*mat_in, gray, code);
  return StageOutput{detail::mat_to_frame(gray, PixelFormat::Grayscale8)};
}

}  // namespace shotocr::vision
