#pragma once

#include <chrono>
#include <map>
#include <mutex>

#include "internal/db/api/repository.hpp"

namespace airspace::db::memory {

class MemoryTransaction;

/*
  In-process backend.

  Same observable semantics as the SQL backends, including the row checks
  (non-empty cells, starts_at < ends_at) and the updated_at rule.
  Transactions are serialized: one holds the store lock from Begin() until
  Commit()/Rollback(). Begin() waits up to busy_timeout, then fails Busy.
*/
class MemoryRepository final : public db::Repository {
 public:
  explicit MemoryRepository(std::chrono::milliseconds busy_timeout = std::chrono::milliseconds(5000));

  std::unique_ptr<Transaction> Begin() override;

  void Bootstrap() override;

  std::optional<model::IdentificationServiceArea> GetIsa(Transaction&, const std::string& id) override;
  std::vector<model::IdentificationServiceArea>   SearchIsas(Transaction&, const model::SearchFilter&) override;
  Result UpsertIsa(Transaction&, model::IdentificationServiceArea&, std::optional<util::TimePoint> expected_updated_at) override;
  Result DeleteIsa(Transaction&, const std::string& id) override;

  std::optional<model::Subscription> GetSubscription(Transaction&, const std::string& id) override;
  std::vector<model::Subscription>   SearchSubscriptions(Transaction&, const model::SearchFilter&) override;
  std::vector<model::Subscription>   SearchSubscriptionsByOwner(Transaction&, const model::CellSet& cells, const std::string& owner) override;
  int64_t MaxSubscriptionCountInCellsByOwner(Transaction&, const model::CellSet& cells, const std::string& owner) override;
  Result  UpsertSubscription(Transaction&, model::Subscription&, std::optional<util::TimePoint> expected_updated_at) override;
  Result  DeleteSubscription(Transaction&, const std::string& id) override;
  Result  IncrementNotificationIndices(Transaction&, const model::SearchFilter&, std::vector<model::Subscription>& updated) override;

  std::optional<model::OperationalIntent> GetOperationalIntent(Transaction&, const std::string& id) override;
  model::CellSet                          ListOperationalIntentCells(Transaction&, const std::string& id) override;
  std::vector<model::OperationalIntent>   SearchOperationalIntents(Transaction&, const model::SearchFilter&) override;
  Result UpsertOperationalIntent(Transaction&, model::OperationalIntent&, std::optional<util::TimePoint> expected_updated_at) override;
  Result DeleteOperationalIntent(Transaction&, const std::string& id) override;
  std::vector<std::string> GetDependentOperationalIntents(Transaction&, const std::string& subscription_id) override;

 private:
  friend class MemoryTransaction;

  // Ordered by id, like the SQL backends' ORDER BY id.
  struct State {
    std::map<std::string, model::IdentificationServiceArea> isas;
    std::map<std::string, model::Subscription>              subscriptions;
    std::map<std::string, model::OperationalIntent>         operational_intents;
  };

  std::chrono::milliseconds busy_timeout_;
  std::timed_mutex          mutex_;
  State                     committed_;
};

} // namespace airspace::db::memory
