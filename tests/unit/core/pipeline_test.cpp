#include <shotocr/core/frame.hpp>
#include <shotocr/core/pipeline.hpp>
#include <shotocr/core/pipeline_stage.hpp>
#include <shotocr/core/shot_reading.hpp>
#include <gtest/gtest.h>
#include <memory>
#include <vector>

namespace sc = shotocr::core;

namespace {

class PassThroughStage : public sc::IPipelineStage {
 public:
  std::expected<sc::StageOutput, sc::PipelineError> process(
      const sc::Frame& input) override {
    std::vector<std::byte> buf(input.data().begin(), input.data().end());
    return sc::StageOutput{sc::Frame(input.width(), input.height(),
                                     input.format(), std::move(buf))};
  }
};

class EmitReadingStage : public sc::IPipelineStage {
 public:
  std::expected<sc::StageOutput, sc::PipelineError> process(
      const sc::Frame&) override {
    sc::FieldMap fields = {{"ball_speed", 85.3}, {"club_head_speed", std::nullopt}};
    return sc::StageOutput{
        sc::ShotReading(sc::DisplayType::Oled, std::move(fields), 0.5, "85.3")};
  }
};

class FailingStage : public sc::IPipelineStage {
 public:
  std::expected<sc::StageOutput, sc::PipelineError> process(
      const sc::Frame&) override {
    ++calls;
    return std::unexpected(sc::PipelineError::OcrEngineError);
  }
  int calls{0};
};

sc::Frame make_frame() {
  std::vector<std::byte> buf(10);
  return sc::Frame(10, 1, sc::PixelFormat::Grayscale8, std::move(buf));
}

}  // namespace

TEST(Pipeline, EmptyPipelineReturnsError) {
  sc::Pipeline p;
  auto result = p.run(make_frame());
  EXPECT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), sc::PipelineError::InvalidConfig);
}

TEST(Pipeline, PassThroughOnlyReturnsInvalidConfig) {
  sc::Pipeline p;
  p.add_stage(std::make_unique<PassThroughStage>());
  auto result = p.run(make_frame());
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), sc::PipelineError::InvalidConfig);
}

TEST(Pipeline, SingleStageEmitsReading) {
  sc::Pipeline p;
  p.add_stage(std::make_unique<EmitReadingStage>());
  auto result = p.run(make_frame());
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->display(), sc::DisplayType::Oled);
  EXPECT_DOUBLE_EQ(result->confidence(), 0.5);
  EXPECT_EQ(result->raw_text(), "85.3");
  ASSERT_EQ(result->fields().size(), 2u);
  EXPECT_DOUBLE_EQ(*result->value("ball_speed"), 85.3);
}

TEST(Pipeline, PassThroughThenEmit) {
  sc::Pipeline p;
  p.add_stage(std::make_unique<PassThroughStage>());
  p.add_stage(std::make_unique<EmitReadingStage>());
  EXPECT_EQ(p.stage_count(), 2u);
  auto result = p.run(make_frame());
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->populated_count(), 1u);
}

TEST(Pipeline, FailureAbortsRemainingStages) {
  sc::Pipeline p;
  auto first = std::make_unique<FailingStage>();
  auto second = std::make_unique<FailingStage>();
  FailingStage* second_ptr = second.get();
  p.add_stage(std::move(first));
  p.add_stage(std::move(second));
  auto result = p.run(make_frame());
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), sc::PipelineError::OcrEngineError);
  EXPECT_EQ(second_ptr->calls, 0);
}

TEST(Pipeline, NullStageIgnored) {
  sc::Pipeline p;
  p.add_stage(nullptr);
  EXPECT_EQ(p.stage_count(), 0u);
}

TEST(Pipeline, TimingCallbackPerStage) {
  sc::Pipeline p;
  p.add_stage(std::make_unique<PassThroughStage>());
  p.add_stage(std::make_unique<EmitReadingStage>());
  std::vector<std::size_t> indices;
  sc::StageTimingCallback cb = [&](std::size_t idx, double ms) {
    indices.push_back(idx);
    EXPECT_GE(ms, 0.0);
  };
  auto result = p.run(make_frame(), &cb);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(indices, (std::vector<std::size_t>{0, 1}));
}
