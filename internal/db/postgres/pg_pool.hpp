#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace relgen::db::postgres {

// Statement names prepared on every pooled connection.
inline constexpr const char* kInsertMention           = "relgen_insert_mention";
inline constexpr const char* kFindMention             = "relgen_find_mention";
inline constexpr const char* kInsertCandidate         = "relgen_insert_candidate";
inline constexpr const char* kInsertCandidateArgument = "relgen_insert_candidate_argument";
inline constexpr const char* kFindCandidate           = "relgen_find_candidate";

/*
  PgPool

  Bounded set of libpqxx connections for PgRepository. A transaction
  checks one connection out for its whole lifetime, so a runner with
  N workers holds at most N connections. Acquire() blocks once
  max_connections are checked out.

  New connections get the per-tuple extraction statements prepared
  (mention and candidate insert-or-ignore and lookup).
*/

class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  explicit PgPool(std::string conninfo, std::size_t max_connections = 16);

  std::shared_ptr<pqxx::connection> Acquire();

 private:
  static void                       PrepareStatements(pqxx::connection& conn);
  std::shared_ptr<pqxx::connection> Wrap(pqxx::connection* conn);
  void                              Release(pqxx::connection* conn);

  std::string conninfo_;
  std::size_t max_connections_;

  std::mutex                                     mutex_;
  std::condition_variable                        cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_connections_ = 0;
};

} // namespace relgen::db::postgres
