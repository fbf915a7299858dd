#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace relgen::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!IsOpen()) return;
  try {
    Rollback();
  } catch (const std::exception& e) {
    RELGEN_LOG_WARN("sqlite rollback failed",
                    {observability::StringField("path", db_->Path()), observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::DoCommit() {
  db_->Exec("COMMIT;");
}

void SqliteTransaction::DoRollback() {
  db_->Exec("ROLLBACK;");
}

} // namespace relgen::db::sqlite
