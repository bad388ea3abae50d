#include "internal/upsert/upsert_statistics.hpp"

namespace codegraph::upsert {

void UpsertStatistics::Record(const UpsertResult& result) {
  total_operations_.fetch_add(1, std::memory_order_relaxed);
  total_processing_time_us_.fetch_add(static_cast<std::uint64_t>(result.processing_time_ms * 1000.0), std::memory_order_relaxed);

  if (!result.success) {
    error_count_.fetch_add(1, std::memory_order_relaxed);
    return;
  }

  switch (result.operation_type) {
    case OperationType::kInsert:
      insert_count_.fetch_add(1, std::memory_order_relaxed);
      break;
    case OperationType::kUpdate:
      update_count_.fetch_add(1, std::memory_order_relaxed);
      break;
    case OperationType::kSkip:
      skip_count_.fetch_add(1, std::memory_order_relaxed);
      break;
  }
}

UpsertStatistics::Counters UpsertStatistics::Snapshot() const {
  Counters snapshot;
  snapshot.insert_count             = insert_count_.load(std::memory_order_relaxed);
  snapshot.update_count             = update_count_.load(std::memory_order_relaxed);
  snapshot.skip_count               = skip_count_.load(std::memory_order_relaxed);
  snapshot.error_count              = error_count_.load(std::memory_order_relaxed);
  snapshot.total_operations         = total_operations_.load(std::memory_order_relaxed);
  snapshot.total_processing_time_ms = static_cast<double>(total_processing_time_us_.load(std::memory_order_relaxed)) / 1000.0;
  if (snapshot.total_operations > 0) {
    snapshot.average_processing_time_ms = snapshot.total_processing_time_ms / static_cast<double>(snapshot.total_operations);
  }
  return snapshot;
}

void UpsertStatistics::Reset() {
  insert_count_.store(0, std::memory_order_relaxed);
  update_count_.store(0, std::memory_order_relaxed);
  skip_count_.store(0, std::memory_order_relaxed);
  error_count_.store(0, std::memory_order_relaxed);
  total_operations_.store(0, std::memory_order_relaxed);
  total_processing_time_us_.store(0, std::memory_order_relaxed);
}

} // namespace codegraph::upsert
