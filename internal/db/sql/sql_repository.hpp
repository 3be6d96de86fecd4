#pragma once

#include <functional>
#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/db/sql/sql_params.hpp"
#include "internal/db/sql/sql_row.hpp"
#include "internal/db/sql/tables.hpp"

namespace airspace::db::sql {

/*
  Repository logic shared by the SQL backends.

  Statements are generated once from the table descriptors and the backend
  dialect. A backend only supplies:
    - Begin() / Bootstrap()
    - Query(): run one statement inside the transaction, visiting each row

  Query() reports failures by throwing DbError; this class turns them into
  Result on the write paths.
*/

class SqlRepository : public Repository {
 public:
  explicit SqlRepository(std::unique_ptr<Dialect> dialect);

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

 protected:
  using RowVisitor = std::function<void(const Row&)>;

  virtual void Query(Transaction& tx, const std::string& sql, const Params& params, const RowVisitor& visit) = 0;

  const Dialect& dialect() const {
    return *dialect_;
  }

 private:
  struct TableStatements {
    std::string select_by_id;
    std::string upsert;
    std::string conditional_update;
    std::string delete_by_id;
    std::string exists_by_id;
    std::string search;
    std::string search_by_owner;
  };

  static TableStatements BuildStatements(const Dialect& dialect, const TableDescriptor& table);

  bool   Exists(Transaction& tx, const TableStatements& statements, const std::string& id);
  Result Delete(Transaction& tx, const TableStatements& statements, const std::string& id);

  // Runs the insert-or-replace or the guarded update and decodes the returned row.
  template <typename Record, typename Decode>
  Result Write(Transaction& tx,
               const TableStatements& statements,
               Params params,
               std::optional<util::TimePoint> expected_updated_at,
               Record& record,
               Decode decode);

  std::unique_ptr<Dialect> dialect_;

  TableStatements isa_;
  TableStatements subscription_;
  TableStatements operational_intent_;

  std::string unnest_operational_intent_cells_;
  std::string max_subscriptions_per_cell_;
  std::string increment_notification_index_;
  std::string select_dependent_ids_;
};

} // namespace airspace::db::sql
