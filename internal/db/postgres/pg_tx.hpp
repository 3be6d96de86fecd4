#pragma once

#include <memory>
#include <pqxx/pqxx>

#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace airspace::db::postgres {

/*
  One pqxx::work on a pooled connection (READ COMMITTED).

  Concurrent writers are fenced by the guarded updates, not by isolation.
*/
class PgTransaction final : public db::Transaction {
 public:
  explicit PgTransaction(std::shared_ptr<PgPool> pool);
  ~PgTransaction() override;

  pqxx::work& Work() {
    return *tx_;
  }

  void Commit() override;
  void Rollback() override;
  bool IsFinished() const override {
    return finished_;
  }
  void Interrupt() override;

 private:
  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::work>       tx_;
  bool                              finished_ = false;
};

// Maps a pqxx exception onto the portable codes.
Result Translate(const std::exception& e);

} // namespace airspace::db::postgres
