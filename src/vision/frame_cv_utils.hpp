#pragma once

#include <shotocr/core/frame.hpp>
#include <opencv2/core/mat.hpp>
#include <optional>

namespace shotocr::vision::detail {

/// Wrap Frame as cv::Mat (non-owning view). Returns nullopt if empty or format unsupported.
std::optional<cv::Mat> frame_to_mat(const shotocr::core::Frame& frame);

/// Convert cv::Mat (8-bit) to Frame (copy).
shotocr::core::Frame mat_to_frame(const cv::Mat& mat,
                                  shotocr::core::PixelFormat format);

}  // namespace shotocr::vision::detail
