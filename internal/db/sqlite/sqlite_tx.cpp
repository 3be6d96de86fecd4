#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace airspace::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), lock_(db_->TxMutex(), std::defer_lock) {
  if (!lock_.try_lock_for(db_->BusyTimeout())) {
    throw DbError(ErrorCode::Busy, "sqlite connection busy");
  }
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const DbError& e) {
      // The connection rolls back on its own when a statement fails hard; still worth a line.
      AIRSPACE_LOG_WARN("sqlite rollback failed", {observability::StringField("error", e.what())});
    }
  }
  Disarm();
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  Disarm();
  finished_ = true;
  lock_.unlock();
}

void SqliteTransaction::Rollback() {
  finished_ = true;
  Disarm();
  db_->Exec("ROLLBACK;");
  lock_.unlock();
}

void SqliteTransaction::Interrupt() {
  std::lock_guard<std::mutex> guard(interrupt_mutex_);
  if (interruptible_) sqlite3_interrupt(db_->Handle());
}

// Must run before TxMutex is released to the next transaction.
void SqliteTransaction::Disarm() {
  std::lock_guard<std::mutex> guard(interrupt_mutex_);
  interruptible_ = false;
}

} // namespace airspace::db::sqlite
