#include "memory_tx.hpp"

namespace airspace::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo), lock_(repo_.mutex_, std::defer_lock) {
  if (!lock_.try_lock_for(repo_.busy_timeout_)) {
    throw DbError(ErrorCode::Busy, "memory store busy");
  }
  working_ = repo_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (!finished_) Rollback();
}

MemoryRepository::State& MemoryTransaction::Mutable() {
  if (finished_) throw DbError(ErrorCode::InternalError, "transaction already finished");
  if (interrupted_.load()) throw DbError(ErrorCode::Cancelled, "transaction interrupted");
  return working_;
}

void MemoryTransaction::Commit() {
  if (finished_) throw DbError(ErrorCode::InternalError, "transaction already finished");
  if (interrupted_.load()) throw DbError(ErrorCode::Cancelled, "transaction interrupted");
  repo_.committed_ = std::move(working_);
  finished_        = true;
  lock_.unlock();
}

void MemoryTransaction::Rollback() {
  finished_ = true;
  if (lock_.owns_lock()) lock_.unlock();
}

void MemoryTransaction::Interrupt() {
  interrupted_.store(true);
}

} // namespace airspace::db::memory
