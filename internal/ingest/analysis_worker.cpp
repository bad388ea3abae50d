#include "analysis_worker.hpp"

#include "internal/analysis/relationship_analyzer.hpp"
#include "internal/observability/logging.hpp"

namespace codegraph::ingest {

AnalysisWorker::AnalysisWorker(std::shared_ptr<AnalysisScheduler> scheduler, const analysis::RelationshipAnalyzer& analyzer,
                               std::vector<AnalysisSlot>& slots)
    : scheduler_(std::move(scheduler)), analyzer_(analyzer), slots_(slots) {
}

AnalysisWorker::~AnalysisWorker() {
  Stop();
}

void AnalysisWorker::Start() {
  thread_  = std::thread(&AnalysisWorker::Run, this);
}

void AnalysisWorker::Stop() {
  scheduler_->Shutdown();
  if (thread_.joinable()) thread_.join();
}

void AnalysisWorker::Run() {
  while (true) {
    auto task = scheduler_->Dequeue();
    if (!task) break;

    auto& slot = slots_[task->slot];
    try {
      slot.result = analyzer_.Analyze(*task->unit);
    } catch (const std::exception& e) {
      CODEGRAPH_LOG_ERROR("Analysis failed",
                          {observability::StringField("file", task->unit->file_path), observability::StringField("error", e.what())});
      slot.error = std::current_exception();
    }
  }
}

} // namespace codegraph::ingest
