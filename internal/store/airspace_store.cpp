#include "airspace_store.hpp"

#include <stdexcept>

namespace airspace::store {

#if AIRSPACE_GEO_S2
AirspaceStore::AirspaceStore(std::shared_ptr<db::Repository> db) : AirspaceStore(std::move(db), std::make_shared<const geo::CoveringEngine>()) {
}

AirspaceStore::AirspaceStore(std::shared_ptr<db::Repository> db, std::shared_ptr<const geo::CoveringEngine> covering)
    : db_(std::move(db)),
      covering_(std::move(covering)),
      coordinator_(db_),
      isas_(db_),
      subscriptions_(db_),
      operational_intents_(db_),
      dependencies_(db_) {
  if (!covering_) throw std::invalid_argument("AirspaceStore: covering engine must not be null");
}
#else
AirspaceStore::AirspaceStore(std::shared_ptr<db::Repository> db)
    : db_(std::move(db)), coordinator_(db_), isas_(db_), subscriptions_(db_), operational_intents_(db_), dependencies_(db_) {
}
#endif

void AirspaceStore::Bootstrap() {
  try {
    db_->Bootstrap();
  } catch (const db::DbError& e) {
    ThrowTranslated("bootstrap", e);
  }
}

model::IdentificationServiceArea AirspaceStore::GetIsa(const std::string& id, std::stop_token stop) {
  return Run("get identification_service_area", [&](Scope& scope) { return isas_.Get(scope, id); }, std::move(stop));
}

model::Subscription AirspaceStore::GetSubscription(const std::string& id, std::stop_token stop) {
  return Run("get subscription", [&](Scope& scope) { return subscriptions_.Get(scope, id); }, std::move(stop));
}

model::OperationalIntent AirspaceStore::GetOperationalIntent(const std::string& id, std::stop_token stop) {
  return Run("get operational_intent", [&](Scope& scope) { return operational_intents_.Get(scope, id); }, std::move(stop));
}

std::vector<model::IdentificationServiceArea> AirspaceStore::SearchIsas(const model::SearchFilter& filter, std::stop_token stop) {
  return Run("search identification_service_area", [&](Scope& scope) { return isas_.Search(scope, filter); }, std::move(stop));
}

std::vector<model::Subscription> AirspaceStore::SearchSubscriptions(const model::SearchFilter& filter, std::stop_token stop) {
  return Run("search subscription", [&](Scope& scope) { return subscriptions_.Search(scope, filter); }, std::move(stop));
}

std::vector<model::OperationalIntent> AirspaceStore::SearchOperationalIntents(const model::SearchFilter& filter, std::stop_token stop) {
  return Run("search operational_intent", [&](Scope& scope) { return operational_intents_.Search(scope, filter); }, std::move(stop));
}

#if AIRSPACE_GEO_S2
std::vector<model::IdentificationServiceArea> AirspaceStore::SearchIsas(const model::Volume4D& volume, std::stop_token stop) {
  return SearchIsas(covering_->MakeSearchFilter(volume), std::move(stop));
}

std::vector<model::Subscription> AirspaceStore::SearchSubscriptions(const model::Volume4D& volume, std::stop_token stop) {
  return SearchSubscriptions(covering_->MakeSearchFilter(volume), std::move(stop));
}

std::vector<model::OperationalIntent> AirspaceStore::SearchOperationalIntents(const model::Volume4D& volume, std::stop_token stop) {
  return SearchOperationalIntents(covering_->MakeSearchFilter(volume), std::move(stop));
}
#endif

std::vector<std::string> AirspaceStore::DependentsOfSubscription(const std::string& subscription_id, std::stop_token stop) {
  return Run("dependents of subscription", [&](Scope& scope) { return dependencies_.DependentsOfSubscription(scope, subscription_id); },
             std::move(stop));
}

} // namespace airspace::store
