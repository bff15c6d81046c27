#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

namespace chainweave::db::sqlite {

/*
  RAII owner of a sqlite3 connection opened in serialized mode.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // pragmas, schema and BEGIN/COMMIT
  void Exec(const std::string& sql);

 private:
  void Configure();

  sqlite3*    db_ = nullptr;
  std::string path_;
};

// Owns a prepared statement.
struct StatementDeleter {
  void operator()(sqlite3_stmt* stmt) const {
    sqlite3_finalize(stmt);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

} // namespace chainweave::db::sqlite
