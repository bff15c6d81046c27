#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"

namespace chainweave::db::sqlite {

/*
  SQLite transaction wrapper.

  BEGIN IMMEDIATE takes the write lock up front so two archivers never
  deadlock upgrading a read lock.
*/
class SqliteTransaction final : public db::Transaction {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction() override;

  sqlite3* Handle() const {
    return db_->Handle();
  }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

 private:
  std::shared_ptr<SqliteDB> db_;
  bool                      committed_ = false;
  bool                      finished_  = false;
};

} // namespace chainweave::db::sqlite
