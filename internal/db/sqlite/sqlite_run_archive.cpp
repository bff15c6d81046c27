#include "internal/db/sqlite/sqlite_run_archive.hpp"

#include <string>
#include <vector>

namespace chainweave::db::sqlite {

using chainweave::db::ErrorCode;
using chainweave::db::Result;

namespace {

constexpr int kSchemaVersion = 1;

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

Statement Prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK) {
    return Statement{};
  }
  return Statement{raw};
}

model::RunRecord ReadRun(sqlite3_stmt* st) {
  model::RunRecord r;
  r.run_id        = ColText(st, 0);
  r.fingerprint   = ColText(st, 1);
  r.goal_tag      = ColText(st, 2);
  r.mode          = ColText(st, 3);
  r.status        = ColText(st, 4);
  r.started_at_ms = ColU64(st, 5);
  r.ended_at_ms   = ColU64(st, 6);
  r.aborted       = sqlite3_column_int(st, 7) != 0;
  r.snapshot_json = ColText(st, 8);
  return r;
}

constexpr const char* kRunColumns = "run_id,fingerprint,goal_tag,mode,status,started_at_ms,ended_at_ms,aborted,snapshot_json";

} // namespace

void BootstrapSqliteSchema(SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS chainweave_schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS chain_runs (run_id TEXT PRIMARY KEY, fingerprint TEXT NOT NULL, goal_tag TEXT NOT NULL, mode TEXT NOT NULL, status TEXT NOT NULL, started_at_ms INTEGER NOT NULL, ended_at_ms INTEGER NOT NULL, aborted INTEGER NOT NULL DEFAULT 0, snapshot_json TEXT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS chain_runs_started_idx ON chain_runs(started_at_ms);",
      "CREATE TABLE IF NOT EXISTS plugin_performance (id INTEGER PRIMARY KEY AUTOINCREMENT, plugin_name TEXT NOT NULL, run_id TEXT NOT NULL, duration_ms REAL NOT NULL, success INTEGER NOT NULL, recorded_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS plugin_performance_plugin_idx ON plugin_performance(plugin_name);"};

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }
  db.Exec("INSERT OR IGNORE INTO chainweave_schema_migrations(version, applied_at_ms) VALUES(" + std::to_string(kSchemaVersion) +
          ", CAST(strftime('%s','now') AS INTEGER) * 1000);");
}

SqliteRunArchive::SqliteRunArchive(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<Transaction> SqliteRunArchive::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRunArchive::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRunArchive::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Runs
// ------------------------------------------------------------------

Result SqliteRunArchive::InsertRun(Transaction& t, const model::RunRecord& r) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db,
                    "INSERT INTO chain_runs(run_id,fingerprint,goal_tag,mode,status,started_at_ms,ended_at_ms,aborted,snapshot_json) "
                    "VALUES(?,?,?,?,?,?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.run_id);
  BindText(st.get(), 2, r.fingerprint);
  BindText(st.get(), 3, r.goal_tag);
  BindText(st.get(), 4, r.mode);
  BindText(st.get(), 5, r.status);
  BindU64(st.get(), 6, r.started_at_ms);
  BindU64(st.get(), 7, r.ended_at_ms);
  sqlite3_bind_int(st.get(), 8, r.aborted ? 1 : 0);
  BindText(st.get(), 9, r.snapshot_json);

  const int rc = sqlite3_step(st.get());
  if ((rc & 0xff) == SQLITE_CONSTRAINT) {
    return Result::Err(ErrorCode::AlreadyExists, "run already archived: " + r.run_id);
  }
  return Translate(db, rc);
}

std::optional<model::RunRecord> SqliteRunArchive::GetRun(Transaction& t, const std::string& run_id) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("SELECT ") + kRunColumns + " FROM chain_runs WHERE run_id=?;";
  auto              st  = Prepare(db, sql.c_str());
  if (!st) return std::nullopt;

  BindText(st.get(), 1, run_id);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadRun(st.get());
}

std::vector<model::RunRecord> SqliteRunArchive::ListRuns(Transaction& t, std::size_t limit) {
  auto* db = TX(t).Handle();

  std::string sql = std::string("SELECT ") + kRunColumns + " FROM chain_runs ORDER BY started_at_ms DESC, run_id ASC";
  if (limit > 0) sql += " LIMIT " + std::to_string(limit);
  sql += ";";

  std::vector<model::RunRecord> out;
  auto                          st = Prepare(db, sql.c_str());
  if (!st) return out;

  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadRun(st.get()));
  }
  return out;
}

// ------------------------------------------------------------------
// Performance
// ------------------------------------------------------------------

Result SqliteRunArchive::InsertPerformance(Transaction& t, const model::PerformanceRecord& r) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, "INSERT INTO plugin_performance(plugin_name,run_id,duration_ms,success,recorded_at_ms) VALUES(?,?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.plugin_name);
  BindText(st.get(), 2, r.run_id);
  sqlite3_bind_double(st.get(), 3, r.duration_ms);
  sqlite3_bind_int(st.get(), 4, r.success ? 1 : 0);
  BindU64(st.get(), 5, r.recorded_at_ms);

  return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::PerformanceRecord> SqliteRunArchive::ListPerformance(Transaction& t, const std::string& plugin_name) {
  auto* db = TX(t).Handle();

  std::vector<model::PerformanceRecord> out;
  auto st = Prepare(db, "SELECT plugin_name,run_id,duration_ms,success,recorded_at_ms FROM plugin_performance WHERE plugin_name=? ORDER BY id ASC;");
  if (!st) return out;

  BindText(st.get(), 1, plugin_name);
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    model::PerformanceRecord r;
    r.plugin_name    = ColText(st.get(), 0);
    r.run_id         = ColText(st.get(), 1);
    r.duration_ms    = sqlite3_column_double(st.get(), 2);
    r.success        = sqlite3_column_int(st.get(), 3) != 0;
    r.recorded_at_ms = ColU64(st.get(), 4);
    out.push_back(std::move(r));
  }
  return out;
}

} // namespace chainweave::db::sqlite
