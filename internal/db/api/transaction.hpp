#pragma once

namespace airspace::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed

  SQLite: BEGIN IMMEDIATE
  Postgres: pqxx::work
  Memory: snapshot copy under the store lock
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true once Commit() or Rollback() completed
  virtual bool IsFinished() const = 0;

  // Abort the statement currently executing, from any thread.
  // The interrupted call fails with ErrorCode::Cancelled.
  virtual void Interrupt() = 0;
};

}
