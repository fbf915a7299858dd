#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "sqlite_db.hpp"

namespace relgen::db::sqlite {

/*
  SqlitePool

  Bounded set of sqlite3 connections for SqliteRepository, one per
  open transaction. A ":memory:" database exists per connection, so
  the pool is capped at one connection for it and transactions queue.
  Connections go back to the idle list when the last shared_ptr to
  them is dropped.
*/
class SqlitePool : public std::enable_shared_from_this<SqlitePool> {
 public:
  SqlitePool(std::string path, std::size_t max_connections = 8, int busy_timeout_ms = 30000);

  // Acquire a ready-to-use connection, blocking while all are busy
  std::shared_ptr<SqliteDB> Acquire();

  const std::string& Path() const {
    return path_;
  }

 private:
  std::shared_ptr<SqliteDB> Wrap(SqliteDB* db);
  void                      Release(SqliteDB* db);

  std::string path_;
  std::size_t max_connections_;
  int         busy_timeout_ms_;

  std::mutex                             mutex_;
  std::condition_variable                cv_;
  std::vector<std::unique_ptr<SqliteDB>> idle_;
  std::size_t                            live_connections_ = 0;
};

} // namespace relgen::db::sqlite
