#pragma once

#include <cstdint>

#include "internal/db/api/transaction.hpp"
#include "internal/db/memory/memory_repository.hpp"

namespace codegraph::db::memory {

/*
  Transaction = snapshot + write set

  Commit fails when another transaction committed after this one took
  its snapshot, so a lookup-compare-write sequence never loses an update.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction() override;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_ || rolled_back_;
  }

  MemoryRepository::State& Mutable() {
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  MemoryRepository&       repo_;
  MemoryRepository::State working_;
  std::uint64_t           snapshot_version_ = 0;
  bool                    committed_        = false;
  bool                    rolled_back_      = false;
};

} // namespace codegraph::db::memory
