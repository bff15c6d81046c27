#pragma once

#include <cstdint>

#include "internal/db/api/transaction.hpp"
#include "internal/db/memory/memory_run_archive.hpp"

namespace chainweave::db::memory {

/*
  Transaction = snapshot + write set. Commit fails if another
  transaction committed after the snapshot was taken.
*/
class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRunArchive& archive);
  ~MemoryTransaction() override;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryRunArchive::State& Mutable() {
    return working_;
  }
  const MemoryRunArchive::State& View() const {
    return working_;
  }

 private:
  MemoryRunArchive&       archive_;
  MemoryRunArchive::State working_;
  uint64_t                snapshot_version_ = 0;
  bool                    committed_        = false;
  bool                    rolled_back_      = false;
};

} // namespace chainweave::db::memory
