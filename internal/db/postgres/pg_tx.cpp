#include "pg_tx.hpp"

#include <string_view>

#include "internal/observability/logging.hpp"

namespace airspace::db::postgres {

Result Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::broken_connection*>(&e) != nullptr) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  if (dynamic_cast<const pqxx::in_doubt_error*>(&e) != nullptr) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  if (const auto* sql = dynamic_cast<const pqxx::sql_error*>(&e)) {
    const std::string_view state = sql->sqlstate();
    if (state == "40001" || state == "40P01") return Result::Err(ErrorCode::SerializationFailure, e.what());
    if (state == "57014") return Result::Err(ErrorCode::Cancelled, e.what());
    if (state == "55P03") return Result::Err(ErrorCode::Busy, e.what());
    if (state.substr(0, 2) == "23") return Result::Err(ErrorCode::ConstraintViolation, e.what());
    if (state == "XX001" || state == "XX002") return Result::Err(ErrorCode::Corruption, e.what());
    if (state.substr(0, 2) == "08") return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool) {
  try {
    conn_ = pool->Acquire();
    tx_   = std::make_unique<pqxx::work>(*conn_);
  } catch (const std::exception& e) {
    throw DbError(Translate(e));
  }
}

PgTransaction::~PgTransaction() {
  if (finished_) return;
  try {
    tx_->abort();
  } catch (const std::exception& e) {
    AIRSPACE_LOG_WARN("postgres rollback failed", {observability::StringField("error", e.what())});
  }
}

void PgTransaction::Commit() {
  try {
    tx_->commit();
  } catch (const std::exception& e) {
    // pqxx closes the transaction on a failed commit; nothing left to abort.
    finished_ = true;
    throw DbError(Translate(e));
  }
  finished_ = true;
}

void PgTransaction::Rollback() {
  finished_ = true;
  try {
    tx_->abort();
  } catch (const std::exception& e) {
    throw DbError(Translate(e));
  }
}

void PgTransaction::Interrupt() {
  try {
    conn_->cancel_query();
  } catch (const std::exception& e) {
    AIRSPACE_LOG_WARN("postgres cancel request failed", {observability::StringField("error", e.what())});
  }
}

} // namespace airspace::db::postgres
