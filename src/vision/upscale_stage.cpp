#include <shotocr/vision/upscale_stage.hpp>
#include "frame_cv_utils.hpp"
#include <shotocr/core/error.hpp>
#include <shotocr/core/frame.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cstdint>
#include <vector>

namespace shotocr::vision {

UpscaleStage::UpscaleStage(std::uint32_t min_height) : min_height_(min_height) {}

std::expected<shotocr::core::StageOutput, shotocr::core::PipelineError>
UpscaleStage::process(const shotocr::core::Frame& input) {
  using namespace shotocr::core;

  auto mat_in = detail::frame_to_mat(input);
  if (!mat_in) {
    return std::unexpected(PipelineError::InvalidFrame);
  }

  if (input.height() >= min_height_) {
    std::vector<std::byte> buf(input.data().begin(), input.data().end());
    return StageOutput{
        Frame(input.width(), input.height(), input.format(), std::move(buf))};
  }

  const auto scaled_width =
      static_cast<std::uint64_t>(input.width()) * min_height_ / input.height();
  const int new_width = std::max(1, static_cast<int>(scaled_width));

  cv::Mat mat_out;
  cv::resize(*mat_in, mat_out,
             cv::Size(new_width, static_cast<int>(min_height_)),
             0, 0, cv::INTER_CUBIC);

  return StageOutput{detail::mat_to_frame(mat_out, input.format())};
}

}  // namespace shotocr::vision
