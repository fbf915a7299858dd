#include "sqlite_pool.hpp"

#include <exception>

namespace relgen::db::sqlite {

SqlitePool::SqlitePool(std::string path, std::size_t max_connections, int busy_timeout_ms)
    : path_(std::move(path)),
      max_connections_(max_connections == 0 || path_ == ":memory:" ? 1 : max_connections),
      busy_timeout_ms_(busy_timeout_ms) {
}

std::shared_ptr<SqliteDB> SqlitePool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });

  if (!idle_.empty()) {
    auto db = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(db.release());
  }

  ++live_connections_;
  lock.unlock();

  std::unique_ptr<SqliteDB> db;
  try {
    db = std::make_unique<SqliteDB>(path_, busy_timeout_ms_);
  } catch (const std::exception&) {
    {
      std::lock_guard slot_lock(mutex_);
      --live_connections_;
    }
    cv_.notify_one();
    throw;
  }
  return Wrap(db.release());
}

std::shared_ptr<SqliteDB> SqlitePool::Wrap(SqliteDB* db) {
  std::weak_ptr<SqlitePool> pool = shared_from_this();
  return std::shared_ptr<SqliteDB>(db, [pool](SqliteDB* returned) {
    if (auto self = pool.lock()) {
      self->Release(returned);
    } else {
      delete returned;
    }
  });
}

void SqlitePool::Release(SqliteDB* db) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(db);
  }
  cv_.notify_one();
}

} // namespace relgen::db::sqlite
