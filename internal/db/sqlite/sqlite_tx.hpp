#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace relgen::db::sqlite {

/*
  SQLite transaction on a pooled connection.

  BEGIN IMMEDIATE takes the write lock up front. Parallel workers
  then queue on busy_timeout at Begin() instead of failing with
  SQLITE_BUSY halfway through a document.
*/
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction() override;

  sqlite3* Handle() const { return db_->Handle(); }

protected:
  void DoCommit() override;
  void DoRollback() override;

private:
  std::shared_ptr<SqliteDB> db_;
};

}
