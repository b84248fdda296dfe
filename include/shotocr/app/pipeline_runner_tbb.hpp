#pragma once

#include <shotocr/app/pipeline_builder.hpp>
#include <shotocr/app/pipeline_runner.hpp>
#include <shotocr/core/frame.hpp>
#include <vector>

#ifdef SHOTOCR_HAS_TBB

namespace shotocr::app {

/// Runs a batch of frames in parallel using TBB.
///
/// Each TBB worker thread lazily builds its own pipeline from \p factory on first use and
/// reuses it for every frame it is handed, so no OCR engine is ever used from two threads.
/// \p factory may therefore be called concurrently and must be thread-safe.
///
/// \param factory Builds one independent pipeline (preprocessor + recognizer).
/// \param frames Decoded frames. Read only; not modified.
/// \param callback Invoked once per frame with (index, result), successes and failures
///        alike. Must be thread-safe.
void run_pipeline_batch_tbb(const PipelineFactory& factory,
                            const std::vector<shotocr::core::Frame>& frames,
                            ShotResultCallback callback);

}  // namespace shotocr::app

#endif  // SHOTOCR_HAS_TBB
