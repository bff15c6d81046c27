#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/performance_record.hpp"
#include "internal/db/model/run_record.hpp"

namespace chainweave::db {

/*
  Durable history of retired chain runs and per-plugin timings.

  Every call runs inside a transaction obtained from Begin() of the same
  archive.
*/
class RunArchive {
 public:
  virtual ~RunArchive() = default;

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // AlreadyExists when the run id was archived before
  virtual Result InsertRun(Transaction& tx, const model::RunRecord& record) = 0;

  virtual std::optional<model::RunRecord> GetRun(Transaction& tx, const std::string& run_id) = 0;

  // most recently started first; limit 0 means all
  virtual std::vector<model::RunRecord> ListRuns(Transaction& tx, std::size_t limit) = 0;

  virtual Result InsertPerformance(Transaction& tx, const model::PerformanceRecord& record) = 0;

  // oldest first
  virtual std::vector<model::PerformanceRecord> ListPerformance(Transaction& tx, const std::string& plugin_name) = 0;
};

} // namespace chainweave::db
