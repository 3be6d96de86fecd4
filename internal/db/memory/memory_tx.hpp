#pragma once

#include <atomic>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace airspace::db::memory {

/*
  Transaction = store lock + snapshot copy.

  Writes go to the copy; Commit() installs it.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction() override;

  void Commit() override;
  void Rollback() override;
  bool IsFinished() const override {
    return finished_;
  }
  void Interrupt() override;

  // Throws DbError(Cancelled) once interrupted, DbError(InternalError) once finished.
  MemoryRepository::State& Mutable();

 private:
  MemoryRepository&                  repo_;
  std::unique_lock<std::timed_mutex> lock_;
  MemoryRepository::State            working_;
  std::atomic<bool>                  interrupted_{false};
  bool                               finished_ = false;
};

} // namespace airspace::db::memory
