#include "transaction_coordinator.hpp"

namespace airspace::store {

std::unique_ptr<db::Transaction> TransactionCoordinator::Begin(std::string_view op, std::string_view txn, const std::stop_token& stop) {
  if (stop.stop_requested()) throw util::Cancelled(std::string(op) + ": cancelled");
  try {
    auto tx = repository_->Begin();
    AIRSPACE_LOG_DEBUG("transaction begun", {observability::StringField("op", op), observability::StringField("txn", txn)});
    return tx;
  } catch (const db::DbError& e) {
    ThrowTranslated(op, e);
  }
}

void TransactionCoordinator::Commit(std::string_view op, std::string_view txn, db::Transaction& tx, const std::stop_token& stop) {
  // A stop request that raced the last statement must still win over the commit.
  if (stop.stop_requested()) throw util::Cancelled(std::string(op) + ": cancelled");
  tx.Commit();
  AIRSPACE_LOG_DEBUG("transaction committed", {observability::StringField("op", op), observability::StringField("txn", txn)});
}

void TransactionCoordinator::RollbackAfterFailure(std::string_view op, std::string_view txn, db::Transaction& tx, std::string_view error) {
  observability::LogWarn("transaction rolled back",
                         {observability::StringField("op", op), observability::StringField("txn", txn), observability::StringField("error", error)});
  if (tx.IsFinished()) return;
  try {
    tx.Rollback();
  } catch (const std::exception& e) {
    // The original failure is what the caller sees; the transaction object
    // still discards its writes when destroyed.
    observability::LogError("rollback failed",
                            {observability::StringField("op", op), observability::StringField("txn", txn), observability::StringField("error", e.what())});
  }
}

} // namespace airspace::store
