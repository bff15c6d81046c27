#include "internal/db/memory/memory_tx.hpp"

#include "internal/util/errors.hpp"

namespace chainweave::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRunArchive& archive) : archive_(archive) {
  std::scoped_lock lock(archive_.mutex_);
  working_          = archive_.committed_;
  snapshot_version_ = archive_.committed_version_;
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Commit() {
  std::scoped_lock lock(archive_.mutex_);
  if (archive_.committed_version_ != snapshot_version_) {
    throw util::InvalidState("transaction conflict: archive was modified by a concurrent transaction");
  }
  archive_.committed_ = std::move(working_);
  archive_.committed_version_++;
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  rolled_back_ = true;
}

} // namespace chainweave::db::memory
