#pragma once

#include <memory>

#include "internal/db/api/run_archive.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_tx.hpp"

namespace chainweave::db::sqlite {

// Creates chain_runs, plugin_performance and the migrations table.
void BootstrapSqliteSchema(SqliteDB& db);

class SqliteRunArchive final : public db::RunArchive {
 public:
  explicit SqliteRunArchive(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result                          InsertRun(Transaction&, const model::RunRecord&) override;
  std::optional<model::RunRecord> GetRun(Transaction&, const std::string&) override;
  std::vector<model::RunRecord>   ListRuns(Transaction&, std::size_t limit) override;

  Result                                  InsertPerformance(Transaction&, const model::PerformanceRecord&) override;
  std::vector<model::PerformanceRecord> ListPerformance(Transaction&, const std::string&) override;

 private:
  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;
};

} // namespace chainweave::db::sqlite
