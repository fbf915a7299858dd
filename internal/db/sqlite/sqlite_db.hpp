#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

namespace relgen::db::sqlite {

/*
  Thin RAII wrapper around one sqlite3* connection.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, int busy_timeout_ms = 30000);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/schema bootstrap)
  void Exec(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure(int busy_timeout_ms);

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace relgen::db::sqlite
