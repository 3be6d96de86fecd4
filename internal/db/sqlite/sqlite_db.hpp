#pragma once

#include <sqlite3.h>

#include <chrono>
#include <mutex>
#include <string>

#include "internal/db/api/result.hpp"

namespace airspace::db::sqlite {

/*
  Thin RAII wrapper around one sqlite3* connection.

  The connection runs one transaction at a time; SqliteTransaction holds
  TxMutex() for its whole lifetime.
*/
class SqliteDB {
 public:
  SqliteDB(std::string path, std::chrono::milliseconds busy_timeout);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  std::chrono::milliseconds BusyTimeout() const {
    return busy_timeout_;
  }

  std::timed_mutex& TxMutex() {
    return tx_mutex_;
  }

  // Execute a SQL string (pragmas, schema, transaction control).
  // Throws DbError.
  void Exec(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, busy timeout, etc.)
  void Configure();

 private:
  sqlite3*                  db_ = nullptr;
  std::string               path_;
  std::chrono::milliseconds busy_timeout_;
  std::timed_mutex          tx_mutex_;
};

// Maps a sqlite result code (primary or extended) onto the portable codes.
Result Translate(sqlite3* db, int rc);

} // namespace airspace::db::sqlite
