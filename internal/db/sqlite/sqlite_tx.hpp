#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace airspace::db::sqlite {

/*
  SQLite transaction wrapper.

  Uses BEGIN IMMEDIATE:
    - grabs write lock early
    - avoids deadlock-y behavior later

  Waits up to the busy timeout for the connection, then fails with
  ErrorCode::Busy.

  The connection is shared: Interrupt() only reaches sqlite while this
  transaction still owns it.
*/
class SqliteTransaction final : public db::Transaction {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction() override;

  sqlite3* Handle() const {
    return db_->Handle();
  }

  void Commit() override;
  void Rollback() override;
  bool IsFinished() const override {
    return finished_;
  }
  void Interrupt() override;

 private:
  void Disarm();

  std::shared_ptr<SqliteDB>          db_;
  std::unique_lock<std::timed_mutex> lock_;
  bool                               finished_ = false;

  std::mutex interrupt_mutex_;
  bool       interruptible_ = true;
};

} // namespace airspace::db::sqlite
