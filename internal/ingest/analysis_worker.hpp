#pragma once

#include <exception>
#include <memory>
#include <thread>
#include <vector>

#include "analysis_scheduler.hpp"
#include "internal/analysis/compilation_unit.hpp"

namespace codegraph::analysis {
class RelationshipAnalyzer;
}

namespace codegraph::ingest {

// Output slot of one task: the analysis, or the exception it raised.
struct AnalysisSlot {
  analysis::AnalysisResult result;
  std::exception_ptr       error;
};

/*
  Background worker that runs the relationship analyzer.

  Drains the scheduler until it is shut down and empty, writing each
  task's outcome into its own slot.
*/
class AnalysisWorker {
 public:
  AnalysisWorker(std::shared_ptr<AnalysisScheduler> scheduler, const analysis::RelationshipAnalyzer& analyzer, std::vector<AnalysisSlot>& slots);
  ~AnalysisWorker();

  AnalysisWorker(const AnalysisWorker&)            = delete;
  AnalysisWorker& operator=(const AnalysisWorker&) = delete;

  void Start();

  // Shuts the scheduler down and waits for the queue to drain.
  void Stop();

 private:
  void Run();

  std::shared_ptr<AnalysisScheduler>    scheduler_;
  const analysis::RelationshipAnalyzer& analyzer_;
  std::vector<AnalysisSlot>&            slots_;

  std::thread       thread_;
};

} // namespace codegraph::ingest
