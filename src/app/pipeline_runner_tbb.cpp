#include <shotocr/app/pipeline_runner_tbb.hpp>

#ifdef SHOTOCR_HAS_TBB

#include <shotocr/core/pipeline.hpp>
#include <tbb/blocked_range.h>
#include <tbb/enumerable_thread_specific.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>
#include <cstddef>
#include <memory>
#include <vector>

namespace shotocr::app {

void run_pipeline_batch_tbb(const PipelineFactory& factory,
                            const std::vector<shotocr::core::Frame>& frames,
                            ShotResultCallback callback) {
  if (frames.empty() || !callback || !factory) return;

  tbb::enumerable_thread_specific<std::unique_ptr<shotocr::core::Pipeline>> local_pipelines;

  const std::size_t n = frames.size();
  tbb::parallel_for(
      tbb::blocked_range<std::size_t>(0, n),
      [&factory, &frames, &callback, &local_pipelines](
          const tbb::blocked_range<std::size_t>& range) {
        auto& pipeline = local_pipelines.local();
        if (!pipeline) {
          pipeline = std::make_unique<shotocr::core::Pipeline>(factory());
        }
        // Isolated so nested TBB work inside OpenCV cannot re-enter this thread's pipeline.
        tbb::this_task_arena::isolate([&] {
          for (std::size_t i = range.begin(); i != range.end(); ++i) {
            auto result = pipeline->run(frames[i]);
            callback(i, result);
          }
        });
      });
}

}  // namespace shotocr::app

#endif  // SHOTOCR_HAS_TBB
