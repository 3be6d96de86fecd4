#pragma once

#include <memory>
#include <stop_token>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/store/store_errors.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace airspace::store {

/*
  One open backend transaction plus the caller's stop token.

  Handed to the callback of TransactionCoordinator::Run(); every repository
  operation performed through the same Scope is atomic.
*/
class Scope {
 public:
  Scope(db::Transaction& tx, std::stop_token stop) : tx_(tx), stop_(std::move(stop)) {
  }

  db::Transaction& tx() const {
    return tx_;
  }

  void ThrowIfCancelled(std::string_view context) const {
    if (stop_.stop_requested()) throw util::Cancelled(std::string(context) + ": cancelled");
  }

 private:
  db::Transaction& tx_;
  std::stop_token  stop_;
};

/*
  Scoped atomic execution.

  Run(op, fn, stop):
    - begins a transaction and calls fn(Scope&)
    - commits when fn returns
    - rolls back when fn throws (anything), when the commit is refused, or
      when stop is requested, then rethrows
    - a stop request while fn runs interrupts the backend statement in flight

  Backend DbError escaping fn is translated (store_errors.hpp), or reported
  as util::Cancelled once stop was requested; every other exception
  propagates unchanged.
*/
class TransactionCoordinator {
 public:
  explicit TransactionCoordinator(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
  }

  template <typename Fn>
  auto Run(std::string_view op, Fn&& fn, std::stop_token stop = {}) -> std::invoke_result_t<Fn, Scope&>;

 private:
  std::unique_ptr<db::Transaction> Begin(std::string_view op, std::string_view txn, const std::stop_token& stop);
  void                             Commit(std::string_view op, std::string_view txn, db::Transaction& tx, const std::stop_token& stop);
  void RollbackAfterFailure(std::string_view op, std::string_view txn, db::Transaction& tx, std::string_view error);

  std::shared_ptr<db::Repository> repository_;
};

template <typename Fn>
auto TransactionCoordinator::Run(std::string_view op, Fn&& fn, std::stop_token stop) -> std::invoke_result_t<Fn, Scope&> {
  using R = std::invoke_result_t<Fn, Scope&>;

  // Correlates the log lines of one transaction.
  const std::string txn = util::NewId();
  auto              tx  = Begin(op, txn, stop);

  // Declared after tx: destroyed (and waited for) before the transaction goes away.
  std::stop_callback interrupt(stop, [raw = tx.get()] { raw->Interrupt(); });
  Scope              scope(*tx, stop);

  try {
    if constexpr (std::is_void_v<R>) {
      std::forward<Fn>(fn)(scope);
      Commit(op, txn, *tx, stop);
    } else {
      R result = std::forward<Fn>(fn)(scope);
      Commit(op, txn, *tx, stop);
      return result;
    }
  } catch (const db::DbError& e) {
    RollbackAfterFailure(op, txn, *tx, e.what());
    if (stop.stop_requested()) throw util::Cancelled(std::string(op) + ": cancelled");
    ThrowTranslated(op, e);
  } catch (const std::exception& e) {
    RollbackAfterFailure(op, txn, *tx, e.what());
    throw;
  } catch (...) {
    RollbackAfterFailure(op, txn, *tx, "non-standard exception");
    throw;
  }
}

} // namespace airspace::store
