#include "pg_pool.hpp"

#include <exception>

namespace relgen::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  // reserve the slot, then connect without holding the lock
  ++live_connections_;
  lock.unlock();

  std::unique_ptr<pqxx::connection> conn;
  try {
    conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
  } catch (const std::exception&) {
    {
      std::lock_guard slot_lock(mutex_);
      --live_connections_;
    }
    cv_.notify_one();
    throw;
  }
  return Wrap(conn.release());
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare(kInsertMention,
               "INSERT INTO mention(type,document_id,sentence_id,char_start,char_end) VALUES($1,$2,$3,$4,$5) "
               "ON CONFLICT(type,sentence_id,char_start,char_end) DO NOTHING RETURNING id");

  conn.prepare(kFindMention, "SELECT id FROM mention WHERE type=$1 AND sentence_id=$2 AND char_start=$3 AND char_end=$4");

  conn.prepare(kInsertCandidate,
               "INSERT INTO candidate(type,split,document_id,arguments) VALUES($1,$2,$3,$4) "
               "ON CONFLICT(type,split,arguments) DO NOTHING RETURNING id");

  conn.prepare(kInsertCandidateArgument, "INSERT INTO candidate_argument(candidate_id,position,mention_id) VALUES($1,$2,$3)");

  conn.prepare(kFindCandidate, "SELECT id FROM candidate WHERE type=$1 AND split=$2 AND arguments=$3");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> pool = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [pool](pqxx::connection* returned) {
    if (auto self = pool.lock()) {
      self->Release(returned);
    } else {
      delete returned;
    }
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace relgen::db::postgres
