#ifdef SHOTOCR_HAS_TBB

#include <shotocr/app/config.hpp>
#include <shotocr/app/pipeline_builder.hpp>
#include <shotocr/app/pipeline_runner_tbb.hpp>
#include <shotocr/core/display_layout.hpp>
#include <shotocr/core/error.hpp>
#include <shotocr/core/frame.hpp>
#include <shotocr/ocr/mock_ocr_engine.hpp>
#include <gtest/gtest.h>
#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <set>
#include <vector>

namespace {

shotocr::core::Frame make_dummy_frame(std::uint32_t w = 64, std::uint32_t h = 64) {
  const std::size_t bytes = static_cast<std::size_t>(w) * h * 3;
  std::vector<std::byte> buffer(bytes, std::byte{0});
  return shotocr::core::Frame(w, h, shotocr::core::PixelFormat::BGR8, std::move(buffer));
}

}  // namespace

TEST(PipelineRunnerTbbTest, CallbackPerFrameWithIndex) {
  std::atomic<std::size_t> built{0};
  shotocr::app::PipelineFactory factory = [&built]() {
    ++built;
    return shotocr::app::build_pipeline(
        shotocr::app::default_config(), shotocr::core::DisplayType::Oled,
        std::make_unique<shotocr::ocr::MockOcrEngine>("140.2 101.9 231 249"));
  };

  std::vector<shotocr::core::Frame> frames;
  for (int i = 0; i < 6; ++i) frames.push_back(make_dummy_frame());

  std::atomic<std::size_t> call_count{0};
  std::set<std::size_t> indices;
  std::mutex mutex;
  shotocr::app::run_pipeline_batch_tbb(
      factory, frames,
      [&](std::size_t i, const shotocr::app::ShotResult& r) {
        call_count++;
        EXPECT_TRUE(r.has_value());
        if (r) EXPECT_DOUBLE_EQ(r->confidence(), 1.0);
        std::lock_guard lock(mutex);
        indices.insert(i);
      });
  EXPECT_EQ(call_count.load(), 6u);
  EXPECT_EQ(indices.size(), 6u);
  EXPECT_GE(built.load(), 1u);
  EXPECT_LE(built.load(), 6u);
}

TEST(PipelineRunnerTbbTest, FailuresReachCallback) {
  const auto factory = shotocr::app::make_pipeline_factory(
      shotocr::app::default_config(), shotocr::core::DisplayType::Oled,
      []() -> std::unique_ptr<shotocr::ocr::IOcrEngine> {
        auto mock = std::make_unique<shotocr::ocr::MockOcrEngine>();
        mock->set_fail(true);
        return mock;
      });
  std::vector<shotocr::core::Frame> frames;
  frames.push_back(make_dummy_frame());
  frames.push_back(make_dummy_frame());

  std::atomic<std::size_t> failures{0};
  shotocr::app::run_pipeline_batch_tbb(
      factory, frames, [&failures](std::size_t, const shotocr::app::ShotResult& r) {
        if (!r && r.error() == shotocr::core::PipelineError::OcrEngineError) failures++;
      });
  EXPECT_EQ(failures.load(), 2u);
}

TEST(PipelineRunnerTbbTest, EmptyBatchDoesNotCallCallback) {
  const auto factory = shotocr::app::make_pipeline_factory(
      shotocr::app::default_config(), shotocr::core::DisplayType::Oled,
      []() -> std::unique_ptr<shotocr::ocr::IOcrEngine> {
        return std::make_unique<shotocr::ocr::MockOcrEngine>();
      });
  std::vector<shotocr::core::Frame> frames;
  std::atomic<std::size_t> calls{0};
  shotocr::app::run_pipeline_batch_tbb(
      factory, frames, [&calls](std::size_t, const shotocr::app::ShotResult&) { calls++; });
  EXPECT_EQ(calls.load(), 0u);
}

#endif  // SHOTOCR_HAS_TBB
