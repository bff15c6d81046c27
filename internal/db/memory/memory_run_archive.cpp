#include "internal/db/memory/memory_run_archive.hpp"

#include <algorithm>

#include "internal/db/memory/memory_tx.hpp"

namespace chainweave::db::memory {

std::unique_ptr<Transaction> MemoryRunArchive::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

MemoryTransaction& MemoryRunArchive::TX(Transaction& t) {
  return static_cast<MemoryTransaction&>(t);
}

Result MemoryRunArchive::InsertRun(Transaction& t, const model::RunRecord& record) {
  auto& runs = TX(t).Mutable().runs;
  if (!runs.emplace(record.run_id, record).second) {
    return Result::Err(ErrorCode::AlreadyExists, "run already archived: " + record.run_id);
  }
  return Result::Ok();
}

std::optional<model::RunRecord> MemoryRunArchive::GetRun(Transaction& t, const std::string& run_id) {
  const auto& runs = TX(t).View().runs;
  auto        it   = runs.find(run_id);
  if (it == runs.end()) return std::nullopt;
  return it->second;
}

std::vector<model::RunRecord> MemoryRunArchive::ListRuns(Transaction& t, std::size_t limit) {
  std::vector<model::RunRecord> out;
  for (const auto& [_, record] : TX(t).View().runs) {
    out.push_back(record);
  }
  std::stable_sort(out.begin(), out.end(), [](const model::RunRecord& a, const model::RunRecord& b) {
    if (a.started_at_ms != b.started_at_ms) return a.started_at_ms > b.started_at_ms;
    return a.run_id < b.run_id;
  });
  if (limit > 0 && out.size() > limit) out.resize(limit);
  return out;
}

Result MemoryRunArchive::InsertPerformance(Transaction& t, const model::PerformanceRecord& record) {
  TX(t).Mutable().performance[record.plugin_name].push_back(record);
  return Result::Ok();
}

std::vector<model::PerformanceRecord> MemoryRunArchive::ListPerformance(Transaction& t, const std::string& plugin_name) {
  const auto& performance = TX(t).View().performance;
  auto        it          = performance.find(plugin_name);
  if (it == performance.end()) return {};
  return it->second;
}

} // namespace chainweave::db::memory
