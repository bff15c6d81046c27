#pragma once

namespace chainweave::db {

/*
  Abstract archive transaction.

  - Changes are invisible until Commit()
  - Rollback() discards all writes
  - Destructor rolls back if not committed

  SQLite: BEGIN IMMEDIATE
  Memory: snapshot copy
*/

class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;

  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

} // namespace chainweave::db
