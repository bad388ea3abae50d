#pragma once

#include <atomic>
#include <cstdint>

#include "internal/upsert/upsert_result.hpp"

namespace codegraph::upsert {

/*
  Process-local upsert counters.

  Owned by whoever builds the engine and injected into it; nothing is
  persisted. Reset() is the only way to clear them.
*/
class UpsertStatistics {
 public:
  struct Counters {
    std::uint64_t insert_count     = 0;
    std::uint64_t update_count     = 0;
    std::uint64_t skip_count       = 0;
    std::uint64_t error_count      = 0;
    std::uint64_t total_operations = 0;
    double        total_processing_time_ms   = 0.0;
    double        average_processing_time_ms = 0.0;
  };

  void Record(const UpsertResult& result);

  Counters Snapshot() const;

  void Reset();

 private:
  std::atomic<std::uint64_t> insert_count_{0};
  std::atomic<std::uint64_t> update_count_{0};
  std::atomic<std::uint64_t> skip_count_{0};
  std::atomic<std::uint64_t> error_count_{0};
  std::atomic<std::uint64_t> total_operations_{0};
  std::atomic<std::uint64_t> total_processing_time_us_{0};
};

} // namespace codegraph::upsert
