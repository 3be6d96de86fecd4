#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/model/identification_service_area.hpp"
#include "internal/model/operational_intent.hpp"
#include "internal/model/search_filter.hpp"
#include "internal/model/subscription.hpp"

namespace airspace::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - Every call runs inside the given Transaction
  - Reads inside a transaction see its writes
  - updated_at is assigned by the backend on every write and is strictly
    increasing per row (max(backend clock, previous + 1us))
  - A row and its cell set are written atomically

  Upserts:
    expected_updated_at unset -> create-or-replace
    expected_updated_at set   -> update only if the stored row still has that
                                 updated_at; otherwise ErrorCode::Conflict
                                 (and ErrorCode::NotFound if the row is gone)

  On success the written row, as committed, is stored into the in/out record.

  Read paths throw DbError; write paths return Result.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions / schema
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // Idempotent: creates tables, indexes and checks that are missing.
  virtual void Bootstrap() = 0;

  // ---------------------------------------------------------------------
  // Identification Service Areas
  // ---------------------------------------------------------------------

  virtual std::optional<model::IdentificationServiceArea> GetIsa(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::IdentificationServiceArea> SearchIsas(Transaction&, const model::SearchFilter&) = 0;

  virtual Result UpsertIsa(Transaction&, model::IdentificationServiceArea&, std::optional<util::TimePoint> expected_updated_at) = 0;

  virtual Result DeleteIsa(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Subscriptions
  // ---------------------------------------------------------------------

  virtual std::optional<model::Subscription> GetSubscription(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::Subscription> SearchSubscriptions(Transaction&, const model::SearchFilter&) = 0;

  virtual std::vector<model::Subscription> SearchSubscriptionsByOwner(Transaction&, const model::CellSet& cells, const std::string& owner) = 0;

  // Largest number of the owner's subscriptions found in any one of the cells.
  virtual int64_t MaxSubscriptionCountInCellsByOwner(Transaction&, const model::CellSet& cells, const std::string& owner) = 0;

  // notification_index is kept from the stored row (0 for a new row).
  virtual Result UpsertSubscription(Transaction&, model::Subscription&, std::optional<util::TimePoint> expected_updated_at) = 0;

  virtual Result DeleteSubscription(Transaction&, const std::string& id) = 0;

  // Increments notification_index of every subscription matching the filter's
  // cells and time window; updated_at is left untouched.
  virtual Result IncrementNotificationIndices(Transaction&, const model::SearchFilter&, std::vector<model::Subscription>& updated) = 0;

  // ---------------------------------------------------------------------
  // Operational Intents
  // ---------------------------------------------------------------------

  virtual std::optional<model::OperationalIntent> GetOperationalIntent(Transaction&, const std::string& id) = 0;

  // Cell set of one row read through the unnest/expand path.
  virtual model::CellSet ListOperationalIntentCells(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::OperationalIntent> SearchOperationalIntents(Transaction&, const model::SearchFilter&) = 0;

  // version is assigned by the backend: 1 on insert, stored + 1 on update.
  virtual Result UpsertOperationalIntent(Transaction&, model::OperationalIntent&, std::optional<util::TimePoint> expected_updated_at) = 0;

  virtual Result DeleteOperationalIntent(Transaction&, const std::string& id) = 0;

  virtual std::vector<std::string> GetDependentOperationalIntents(Transaction&, const std::string& subscription_id) = 0;
};

} // namespace airspace::db
