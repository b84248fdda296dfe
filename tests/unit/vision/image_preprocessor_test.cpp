#include <shotocr/core/error.hpp>
#include <shotocr/core/frame.hpp>
#include <shotocr/vision/binarize_stage.hpp>
#include <shotocr/vision/grayscale_stage.hpp>
#include <shotocr/vision/image_preprocessor.hpp>
#include <shotocr/vision/upscale_stage.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <gtest/gtest.h>
#include <algorithm>
#include <cstddef>
#include <cstring>
#include <stdexcept>
#include <variant>
#include <vector>

namespace sv = shotocr::vision;
namespace sc = shotocr::core;

namespace {

sc::Frame to_frame(const cv::Mat& mat, sc::PixelFormat format) {
  const std::size_t len = mat.total() * mat.elemSize();
  std::vector<std::byte> buf(len);
  std::memcpy(buf.data(), mat.ptr(), len);
  return sc::Frame(static_cast<std::uint32_t>(mat.cols), static_cast<std::uint32_t>(mat.rows),
                   format, std::move(buf));
}

/// Dark display with bright digits, uneven illumination left to right.
sc::Frame make_display_photo(int width, int height) {
  cv::Mat bgr(height, width, CV_8UC3);
  for (int x = 0; x < width; ++x) {
    const int base = 20 + (60 * x) / width;
    cv::line(bgr, {x, 0}, {x, height - 1}, cv::Scalar(base, base, base));
  }
  cv::putText(bgr, "85.3", {10, height / 2}, cv::FONT_HERSHEY_SIMPLEX, 1.5,
              cv::Scalar(230, 230, 230), 3);
  return to_frame(bgr, sc::PixelFormat::BGR8);
}

sc::Frame frame_of(std::expected<sc::StageOutput, sc::PipelineError> out) {
  EXPECT_TRUE(out.has_value());
  return std::get<sc::Frame>(std::move(*out));
}

}  // namespace

TEST(ImagePreprocessor, ShortPhotoUpscaledToMinHeight) {
  sv::ImagePreprocessor pre;
  auto out = pre.preprocess(make_display_photo(300, 200));
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(out->format(), sc::PixelFormat::Grayscale8);
  EXPECT_EQ(out->height(), 500u);
  EXPECT_EQ(out->width(), 750u);
  EXPECT_EQ(out->size_bytes(), 750u * 500);
}

TEST(ImagePreprocessor, TallPhotoKeepsSize) {
  sv::ImagePreprocessor pre;
  auto out = pre.preprocess(make_display_photo(400, 640));
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(out->width(), 400u);
  EXPECT_EQ(out->height(), 640u);
}

TEST(ImagePreprocessor, TallPhotoOutputIsBinary) {
  sv::ImagePreprocessor pre;
  auto out = pre.preprocess(make_display_photo(400, 600));
  ASSERT_TRUE(out.has_value());
  for (std::byte b : out->data()) {
    const auto v = std::to_integer<int>(b);
    ASSERT_TRUE(v == 0 || v == 255) << "non-binary pixel " << v;
  }
}

TEST(ImagePreprocessor, Deterministic) {
  sv::ImagePreprocessor pre;
  const sc::Frame photo = make_display_photo(320, 240);
  auto a = pre.preprocess(photo);
  auto b = pre.preprocess(photo);
  ASSERT_TRUE(a.has_value());
  ASSERT_TRUE(b.has_value());
  ASSERT_EQ(a->size_bytes(), b->size_bytes());
  EXPECT_TRUE(std::equal(a->data().begin(), a->data().end(), b->data().begin()));
}

TEST(ImagePreprocessor, EmptyFrameRejected) {
  sv::ImagePreprocessor pre;
  auto out = pre.preprocess(sc::Frame{});
  ASSERT_FALSE(out.has_value());
  EXPECT_EQ(out.error(), sc::PipelineError::InvalidFrame);
}

TEST(ImagePreprocessor, UnknownFormatRejected) {
  sv::ImagePreprocessor pre;
  std::vector<std::byte> buf(64);
  auto out = pre.preprocess(sc::Frame(8, 8, sc::PixelFormat::Unknown, std::move(buf)));
  ASSERT_FALSE(out.has_value());
  EXPECT_EQ(out.error(), sc::PipelineError::InvalidFrame);
}

TEST(ImagePreprocessor, ActsAsPipelineStage) {
  sv::ImagePreprocessor pre;
  auto out = pre.process(make_display_photo(100, 100));
  ASSERT_TRUE(out.has_value());
  const auto* frame = std::get_if<sc::Frame>(&*out);
  ASSERT_NE(frame, nullptr);
  EXPECT_EQ(frame->height(), 500u);
}

TEST(ImagePreprocessor, EvenBlockSizeThrows) {
  sv::PreprocessConfig cfg;
  cfg.threshold_block_size = 10;
  EXPECT_THROW(sv::ImagePreprocessor{cfg}, std::invalid_argument);
}

TEST(GrayscaleStage, ConvertsBgra) {
  cv::Mat bgra(4, 4, CV_8UC4, cv::Scalar(255, 255, 255, 255));
  sv::GrayscaleStage stage;
  const sc::Frame out = frame_of(stage.process(to_frame(bgra, sc::PixelFormat::BGRA8)));
  EXPECT_EQ(out.format(), sc::PixelFormat::Grayscale8);
  EXPECT_EQ(out.size_bytes(), 16u);
  EXPECT_EQ(std::to_integer<int>(out.data()[0]), 255);
}

TEST(BinarizeStage, RejectsColorInput) {
  cv::Mat bgr(8, 8, CV_8UC3, cv::Scalar(0, 0, 0));
  sv::BinarizeStage stage(11, 2.0, 2);
  auto out = stage.process(to_frame(bgr, sc::PixelFormat::BGR8));
  ASSERT_FALSE(out.has_value());
  EXPECT_EQ(out.error(), sc::PipelineError::InvalidFrame);
}

TEST(UpscaleStage, KeepsAspectRatio) {
  cv::Mat gray(50, 120, CV_8UC1, cv::Scalar(0));
  sv::UpscaleStage stage(500);
  const sc::Frame out = frame_of(stage.process(to_frame(gray, sc::PixelFormat::Grayscale8)));
  EXPECT_EQ(out.height(), 500u);
  EXPECT_EQ(out.width(), 1200u);
}
