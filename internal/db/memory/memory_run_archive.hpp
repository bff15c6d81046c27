#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <vector>

#include "internal/db/api/run_archive.hpp"

namespace chainweave::db::memory {

class MemoryTransaction;

class MemoryRunArchive final : public db::RunArchive {
 public:
  std::unique_ptr<Transaction> Begin() override;

  Result                          InsertRun(Transaction&, const model::RunRecord&) override;
  std::optional<model::RunRecord> GetRun(Transaction&, const std::string&) override;
  std::vector<model::RunRecord>   ListRuns(Transaction&, std::size_t limit) override;

  Result                                  InsertPerformance(Transaction&, const model::PerformanceRecord&) override;
  std::vector<model::PerformanceRecord> ListPerformance(Transaction&, const std::string&) override;

 private:
  friend class MemoryTransaction;

  struct State {
    std::map<std::string, model::RunRecord>                      runs;
    std::map<std::string, std::vector<model::PerformanceRecord>> performance;
  };

  static MemoryTransaction& TX(Transaction& t);

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

} // namespace chainweave::db::memory
