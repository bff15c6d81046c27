#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/run_archive.hpp"
#include "internal/model/chain_run.hpp"

namespace chainweave::state {

/*
  In-process registry of ChainRun records.

  Each run id owns a slot with its own lock so writers for one run never
  contend with readers of another. Readers always receive copies.

  When an archive is configured, Cleanup() retires finished runs into it
  before dropping them from memory.
*/
class StateStore {
 public:
  explicit StateStore(std::shared_ptr<db::RunArchive> archive = nullptr);

  // Insert or replace the record. Updates from a run that was cleaned up
  // while still active are dropped; a new run may reuse the id. Throws
  // util::InvalidState when the id belongs to another active run.
  void Put(const model::ChainRun& run);

  // Throws util::NotFound.
  model::ChainRun Get(const std::string& run_id) const;

  std::optional<model::ChainRun> Find(const std::string& run_id) const;

  // Runs whose status is not terminal, ordered by run id.
  std::vector<model::ChainRun> ListActive() const;

  std::vector<std::string> ListRunIds() const;

  // Fires the run's cancellation token. False when the run is unknown or
  // already finished.
  bool Cancel(const std::string& run_id);

  // Cancels the run if still active, archives it if finished, and drops
  // it. Unknown ids are a no-op.
  void Cleanup(const std::string& run_id);

  // Cleanup() for every finished run; returns how many were removed.
  std::size_t CleanupFinished();

  std::size_t Size() const;

  // Runs cleaned up while active whose executor has not finished yet.
  std::size_t RetiredCount() const;

  std::optional<db::model::RunRecord> FindArchived(const std::string& run_id) const;

 private:
  struct Slot {
    mutable std::shared_mutex mutex;
    model::ChainRun           run;
  };

  std::shared_ptr<Slot> FindSlot(const std::string& run_id) const;

  static void Write(Slot& slot, const model::ChainRun& run);

  void Archive(const model::ChainRun& run);

  mutable std::shared_mutex                              slots_mutex_;
  std::unordered_map<std::string, std::shared_ptr<Slot>> slots_;
  // run id -> token of the run cleaned up while active
  std::unordered_map<std::string, std::shared_ptr<model::CancellationToken>> retired_;

  std::shared_ptr<db::RunArchive> archive_;
  mutable std::mutex              archive_mutex_;
};

// Row representation of a finished run, as stored by a RunArchive.
db::model::RunRecord ToRunRecord(const model::ChainRun& run);

// One sample per node that actually invoked its plugin.
std::vector<db::model::PerformanceRecord> ToPerformanceRecords(const model::ChainRun& run);

} // namespace chainweave::state
