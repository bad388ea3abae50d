#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

#include "analysis_task.hpp"

namespace codegraph::ingest {

/*
  Thread-safe blocking queue for analysis workers.

  After Shutdown, Dequeue keeps handing out queued tasks and returns
  nullopt only once the queue is empty.
*/
class AnalysisScheduler {
 public:
  void Enqueue(const AnalysisTask& task);

  // blocking wait
  std::optional<AnalysisTask> Dequeue();

  void Shutdown();

 private:
  std::mutex               mutex_;
  std::condition_variable  cv_;
  std::queue<AnalysisTask> queue_;
  bool                     shutdown_ = false;
};

} // namespace codegraph::ingest
