#include <shotocr/app/pipeline_runner.hpp>
#include <algorithm>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace shotocr::app {

ShotResult run_pipeline(shotocr::core::Pipeline& pipeline,
                        const shotocr::core::Frame& frame,
                        StageTimingCallback* timing_cb) {
  return pipeline.run(frame, timing_cb);
}

void run_pipeline_batch(shotocr::core::Pipeline& pipeline,
                        const std::vector<shotocr::core::Frame>& frames,
                        ShotResultCallback callback) {
  for (std::size_t i = 0; i < frames.size(); ++i) {
    auto result = pipeline.run(frames[i]);
    if (callback) {
      callback(i, result);
    }
  }
}

namespace {

std::size_t effective_workers(std::size_t num_workers) {
  if (num_workers > 0) return num_workers;
  const unsigned hw = std::thread::hardware_concurrency();
  return hw > 0 ? static_cast<std::size_t>(hw) : 1;
}

}  // namespace

void run_pipeline_batch_parallel(const PipelineFactory& factory,
                                 const std::vector<shotocr::core::Frame>& frames,
                                 ShotResultCallback callback,
                                 std::size_t num_workers) {
  const std::size_t n = frames.size();
  if (n == 0 || !callback || !factory) return;

  const std::size_t workers = std::min(effective_workers(num_workers), n);
  if (workers <= 1) {
    shotocr::core::Pipeline pipeline = factory();
    run_pipeline_batch(pipeline, frames, std::move(callback));
    return;
  }

  std::queue<std::size_t> index_queue;
  for (std::size_t i = 0; i < n; ++i) {
    index_queue.push(i);
  }
  std::mutex queue_mutex;

  // factory() is only ever called on the caller's thread.
  std::vector<shotocr::core::Pipeline> pipelines;
  pipelines.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    pipelines.push_back(factory());
  }

  auto worker = [&](shotocr::core::Pipeline& pipeline) {
    while (true) {
      std::size_t idx;
      {
        std::lock_guard lock(queue_mutex);
        if (index_queue.empty()) break;
        idx = index_queue.front();
        index_queue.pop();
      }

      auto result = pipeline.run(frames[idx]);
      callback(idx, result);
    }
  };

  std::vector<std::thread> threads;
  threads.reserve(workers);
  for (auto& pipeline : pipelines) {
    threads.emplace_back(worker, std::ref(pipeline));
  }

  for (auto& t : threads) {
    t.join();
  }
}

}  // namespace shotocr::app
