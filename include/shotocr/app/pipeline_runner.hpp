#pragma once

#include <shotocr/app/pipeline_builder.hpp>
#include <shotocr/core/error.hpp>
#include <shotocr/core/frame.hpp>
#include <shotocr/core/pipeline.hpp>
#include <shotocr/core/shot_reading.hpp>
#include <cstddef>
#include <expected>
#include <functional>
#include <vector>

namespace shotocr::app {

/// Outcome for one image: a ShotReading or the error that stopped its pipeline.
using ShotResult = std::expected<shotocr::core::ShotReading, shotocr::core::PipelineError>;

/// Callback for each processed frame: (index into the input batch, result).
/// Invoked for failures too. May be invoked from worker threads in the parallel runners.
using ShotResultCallback = std::function<void(std::size_t index, const ShotResult&)>;

/// Optional per-stage timing: (stage_index, duration_ms). Pass to run_pipeline to get timings.
using StageTimingCallback = shotocr::core::StageTimingCallback;

/// Runs pipeline on a single frame. No threading; direct call.
/// If timing_cb is non-null, it is invoked for each stage with (stage_index, duration_ms).
[[nodiscard]] ShotResult run_pipeline(shotocr::core::Pipeline& pipeline,
                                      const shotocr::core::Frame& frame,
                                      StageTimingCallback* timing_cb = nullptr);

/// Runs pipeline on multiple frames sequentially; calls callback for each result in order.
void run_pipeline_batch(shotocr::core::Pipeline& pipeline,
                        const std::vector<shotocr::core::Frame>& frames,
                        ShotResultCallback callback);

/// Runs frames in parallel on worker threads. Each worker builds its own pipeline from
/// \p factory, so OCR engines are never shared between threads. Callback may be invoked
/// from any worker (must be thread-safe). num_workers 0 = use hardware concurrency.
void run_pipeline_batch_parallel(const PipelineFactory& factory,
                                 const std::vector<shotocr::core::Frame>& frames,
                                 ShotResultCallback callback,
                                 std::size_t num_workers = 0);

}  // namespace shotocr::app
