#pragma once

#include <memory>
#include <pqxx/pqxx>
#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace relgen::db::postgres {

// pqxx::work on a connection checked out of PgPool until destruction.
class PgTransaction final : public db::Transaction {
public:
  explicit PgTransaction(std::shared_ptr<PgPool> pool);
  ~PgTransaction() override;

  pqxx::work& Work() { return *work_; }

protected:
  void DoCommit() override;
  void DoRollback() override;

private:
  // the work must be destroyed before its connection goes back to the pool
  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::work>       work_;
};

}
