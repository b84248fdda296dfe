#include <shotocr/vision/load_image.hpp>
#include "frame_cv_utils.hpp"
#include <shotocr/core/frame.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

namespace shotocr::vision {

namespace {

std::expected<shotocr::core::Frame, shotocr::core::PipelineError> to_frame(
    const cv::Mat& decoded) {
  if (decoded.empty()) {
    return std::unexpected(shotocr::core::PipelineError::ImageDecodeError);
  }
  return detail::mat_to_frame(decoded, shotocr::core::PixelFormat::BGR8);
}

}  // namespace

std::expected<shotocr::core::Frame, shotocr::core::PipelineError>
load_frame_from_file(const std::string& path) {
  return to_frame(cv::imread(path, cv::IMREAD_COLOR));
}

std::expected<shotocr::core::Frame, shotocr::core::PipelineError>
load_frame_from_bytes(std::span<const std::byte> encoded) {
  if (encoded.empty()) {
    return std::unexpected(shotocr::core::PipelineError::ImageDecodeError);
  }
  const cv::Mat raw(1, static_cast<int>(encoded.size()), CV_8UC1,
                    const_cast<std::byte*>(encoded.data()));
  cv::Mat decoded;
  try {
    decoded = cv::imdecode(raw, cv::IMREAD_COLOR);
  } catch (const cv::Exception&) {
    return std::unexpected(shotocr::core::PipelineError::ImageDecodeError);
  }
  return to_frame(decoded);
}

}  // namespace shotocr::vision
