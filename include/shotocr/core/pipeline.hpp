#pragma once

#include <shotocr/core/error.hpp>
#include <shotocr/core/frame.hpp>
#include <shotocr/core/pipeline_stage.hpp>
#include <shotocr/core/shot_reading.hpp>
#include <expected>
#include <functional>
#include <memory>
#include <vector>

namespace shotocr::core {

/// Callback for per-stage timing: (stage_index, duration_ms). Optional; pass to run().
using StageTimingCallback = std::function<void(std::size_t stage_index, double duration_ms)>;

/// Runs a sequence of stages; passes Frame through until a stage returns ShotReading.
/// The first failing stage aborts the run; there is no retry.
class Pipeline {
 public:
  Pipeline() = default;

  void add_stage(std::unique_ptr<IPipelineStage> stage);

  /// Run pipeline on one frame; returns first ShotReading or error.
  /// If timing_cb is non-null, it is called after each stage with (stage_index, duration_ms).
  /// Not thread-safe: stages such as the OCR engine keep per-call state.
  /// Use one Pipeline per thread.
  [[nodiscard]] std::expected<ShotReading, PipelineError> run(
      const Frame& input,
      StageTimingCallback* timing_cb = nullptr);

  [[nodiscard]] std::size_t stage_count() const noexcept {
    return stages_.size();
  }

 private:
  std::vector<std::unique_ptr<IPipelineStage>> stages_;
};

}  // namespace shotocr::core
