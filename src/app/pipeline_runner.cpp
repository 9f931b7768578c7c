#include <earscope/app/pipeline_runner.hpp>
#include <algorithm>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace earscope::app {

void analyze_batch(const AnalysisService& service,
                   const std::vector<earscope::core::Frame>& frames,
                   const earscope::core::AnalysisParams& params,
                   AnalysisCallback callback) {
  if (!callback) return;
  for (std::size_t i = 0; i < frames.size(); ++i) {
    callback(i, service.analyze(frames[i], params));
  }
}

namespace {

std::size_t effective_workers(std::size_t num_workers) {
  if (num_workers > 0) return num_workers;
  const unsigned hw = std::thread::hardware_concurrency();
  return hw > 0 ? static_cast<std::size_t>(hw) : 1;
}

}  // namespace

void analyze_batch_parallel(const AnalysisService& service,
                            const std::vector<earscope::core::Frame>& frames,
                            const earscope::core::AnalysisParams& params,
                            AnalysisCallback callback,
                            std::size_t num_workers) {
  const std::size_t n = frames.size();
  if (n == 0 || !callback) return;

  const std::size_t workers = std::min(effective_workers(num_workers), n);
  if (workers <= 1) {
    analyze_batch(service, frames, params, std::move(callback));
    return;
  }

  // Every index is queued before the workers start; a worker exits once the queue
  // is drained.
  std::queue<std::size_t> index_queue;
  for (std::size_t i = 0; i < n; ++i) {
    index_queue.push(i);
  }
  std::mutex queue_mutex;

  auto worker = [&]() {
    while (true) {
      std::size_t idx;
      {
        std::lock_guard lock(queue_mutex);
        if (index_queue.empty()) break;
        idx = index_queue.front();
        index_queue.pop();
      }
      callback(idx, service.analyze(frames[idx], params));
    }
  };

  std::vector<std::thread> threads;
  threads.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    threads.emplace_back(worker);
  }
  for (auto& t : threads) {
    t.join();
  }
}

}  // namespace earscope::app
