#pragma once

#include <memory>
#include <stop_token>
#include <string>
#include <vector>

#include "internal/geo/covering.hpp"
#include "internal/store/dependency_resolver.hpp"
#include "internal/store/entity_repository.hpp"
#include "internal/store/transaction_coordinator.hpp"

namespace airspace::store {

/*
  AirspaceStore

  Entry point for callers. Owns the backend and hands out the per-kind
  repositories; multi-step work goes through Run():

    store.Run("create operational intent", [&](Scope& scope) {
      auto oi = store.operational_intents().Upsert(scope, input, std::nullopt);
      store.dependencies().IncrementNotificationIndices(scope, filter);
      return oi;
    }, stop);

  The single-read helpers open a scope of their own. With the covering
  engine built in, searches also take a Volume4D and cover its footprint
  before querying.
*/
class AirspaceStore {
 public:
  explicit AirspaceStore(std::shared_ptr<db::Repository> db);
#if AIRSPACE_GEO_S2
  AirspaceStore(std::shared_ptr<db::Repository> db, std::shared_ptr<const geo::CoveringEngine> covering);
#endif

  // Idempotent schema creation.
  void Bootstrap();

  template <typename Fn>
  auto Run(std::string_view op, Fn&& fn, std::stop_token stop = {}) {
    return coordinator_.Run(op, std::forward<Fn>(fn), std::move(stop));
  }

  IsaRepository& isas() {
    return isas_;
  }
  SubscriptionRepository& subscriptions() {
    return subscriptions_;
  }
  OperationalIntentRepository& operational_intents() {
    return operational_intents_;
  }
  DependencyResolver& dependencies() {
    return dependencies_;
  }

  model::IdentificationServiceArea GetIsa(const std::string& id, std::stop_token stop = {});
  model::Subscription              GetSubscription(const std::string& id, std::stop_token stop = {});
  model::OperationalIntent         GetOperationalIntent(const std::string& id, std::stop_token stop = {});

  std::vector<model::IdentificationServiceArea> SearchIsas(const model::SearchFilter& filter, std::stop_token stop = {});
  std::vector<model::Subscription>              SearchSubscriptions(const model::SearchFilter& filter, std::stop_token stop = {});
  std::vector<model::OperationalIntent>         SearchOperationalIntents(const model::SearchFilter& filter, std::stop_token stop = {});

#if AIRSPACE_GEO_S2
  // Throw util::InvalidInput for a missing or degenerate footprint and for inverted bounds.
  std::vector<model::IdentificationServiceArea> SearchIsas(const model::Volume4D& volume, std::stop_token stop = {});
  std::vector<model::Subscription>              SearchSubscriptions(const model::Volume4D& volume, std::stop_token stop = {});
  std::vector<model::OperationalIntent>         SearchOperationalIntents(const model::Volume4D& volume, std::stop_token stop = {});

  const geo::CoveringEngine& covering() const {
    return *covering_;
  }
#endif

  std::vector<std::string> DependentsOfSubscription(const std::string& subscription_id, std::stop_token stop = {});

 private:
  std::shared_ptr<db::Repository> db_;
#if AIRSPACE_GEO_S2
  std::shared_ptr<const geo::CoveringEngine> covering_;
#endif
  TransactionCoordinator          coordinator_;
  IsaRepository                   isas_;
  SubscriptionRepository          subscriptions_;
  OperationalIntentRepository     operational_intents_;
  DependencyResolver              dependencies_;
};

} // namespace airspace::store
