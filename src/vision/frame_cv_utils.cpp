#include "frame_cv_utils.hpp"
#include <shotocr/core/frame.hpp>
#include <opencv2/core.hpp>
#include <cstddef>
#include <cstring>
#include <vector>

namespace shotocr::vision::detail {

namespace sc = shotocr::core;

std::optional<cv::Mat> frame_to_mat(const sc::Frame& frame) {
  if (frame.empty() || frame.width() == 0 || frame.height() == 0) return std::nullopt;

  const std::size_t channels = sc::Frame::channels(frame.format());
  if (channels == 0) return std::nullopt;
  if (frame.size_bytes() < sc::Frame::min_bytes(frame.width(), frame.height(), frame.format())) {
    return std::nullopt;
  }

  const int w = static_cast<int>(frame.width());
  const int h = static_cast<int>(frame.height());
  const std::size_t step = frame.size_bytes() / static_cast<std::size_t>(h);
  auto* data = const_cast<std::byte*>(frame.data().data());
  return cv::Mat(h, w, CV_8UC(static_cast<int>(channels)), data, step);
}

sc::Frame mat_to_frame(const cv::Mat& mat, sc::PixelFormat format) {
  if (mat.empty()) return sc::Frame();

  const cv::Mat contiguous = mat.isContinuous() ? mat : mat.clone();
  const std::uint32_t w = static_cast<std::uint32_t>(contiguous.cols);
  const std::uint32_t h = static_cast<std::uint32_t>(contiguous.rows);
  const std::size_t len = contiguous.total() * contiguous.elemSize();
  std::vector<std::byte> buffer(len);
  std::memcpy(buffer.data(), contiguous.ptr(), len);
  return sc::Frame(w, h, format, std::move(buffer));
}

}  // namespace shotocr::vision::detail
