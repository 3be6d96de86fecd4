#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/store/entity_traits.hpp"
#include "internal/store/transaction_coordinator.hpp"

namespace airspace::store {

/*
  Typed CRUD + search for one entity kind, with version-token fencing.

  Instantiated for IdentificationServiceArea, Subscription and
  OperationalIntent (entity_repository.cpp). All operations run inside the
  caller's Scope and throw the util exception taxonomy.
*/
template <typename Record>
class EntityRepository {
 public:
  explicit EntityRepository(std::shared_ptr<db::Repository> db);
  virtual ~EntityRepository() = default;

  // NotFound when absent. Operational intents re-read their cells through
  // the unnest path; disagreement is a ConsistencyFault.
  Record Get(Scope& scope, const std::string& id);

  // InvalidInput when filter.cells is empty.
  std::vector<Record> Search(Scope& scope, model::SearchFilter filter);

  /*
    expected_token unset: create-or-replace.
    expected_token set:   VersionConflict unless it is the current token of
                          an existing row; the write itself is guarded by
                          the matching updated_at.

    Returns the committed row (input cells, fresh token).
  */
  Record Upsert(Scope& scope, Record entity, const std::optional<std::string>& expected_token);

  // NotFound when no row was deleted.
  void Delete(Scope& scope, const std::string& id);

 protected:
  db::Repository& db() const {
    return *db_;
  }

  std::string Context(std::string_view op, std::string_view id) const;

 private:
  using Traits = EntityTraits<Record>;

  void Validate(const Record& entity) const;
  void CheckCommittedCells(std::string_view op, Record& row, db::Transaction& tx);

  std::shared_ptr<db::Repository> db_;
};

/*
  Subscriptions add owner-scoped queries used for per-cell quotas.
*/
class SubscriptionRepository final : public EntityRepository<model::Subscription> {
 public:
  using EntityRepository<model::Subscription>::EntityRepository;

  std::vector<model::Subscription> SearchByOwner(Scope& scope, const model::CellSet& cells, const std::string& owner);

  // Largest number of the owner's subscriptions in any single one of the cells.
  int64_t MaxCountInCellsByOwner(Scope& scope, const model::CellSet& cells, const std::string& owner);
};

using IsaRepository               = EntityRepository<model::IdentificationServiceArea>;
using OperationalIntentRepository = EntityRepository<model::OperationalIntent>;

extern template class EntityRepository<model::IdentificationServiceArea>;
extern template class EntityRepository<model::Subscription>;
extern template class EntityRepository<model::OperationalIntent>;

} // namespace airspace::store
