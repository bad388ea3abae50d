#include "analysis_scheduler.hpp"

namespace codegraph::ingest {

void AnalysisScheduler::Enqueue(const AnalysisTask& task) {
  {
    std::lock_guard lock(mutex_);
    queue_.push(task);
  }
  cv_.notify_one();
}

std::optional<AnalysisTask> AnalysisScheduler::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  AnalysisTask task = queue_.front();
  queue_.pop();
  return task;
}

void AnalysisScheduler::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

} // namespace codegraph::ingest
