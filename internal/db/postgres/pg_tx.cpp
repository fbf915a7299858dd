#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"

namespace relgen::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool) : conn_(pool->Acquire()) {
  work_ = std::make_unique<pqxx::work>(*conn_);
}

PgTransaction::~PgTransaction() {
  if (!IsOpen()) return;
  try {
    Rollback();
  } catch (const std::exception& e) {
    RELGEN_LOG_WARN("postgres rollback failed", {observability::StringField("error", e.what())});
  }
}

void PgTransaction::DoCommit() {
  work_->commit();
}

void PgTransaction::DoRollback() {
  work_->abort();
}

}
