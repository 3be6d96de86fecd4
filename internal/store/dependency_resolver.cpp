#include "dependency_resolver.hpp"

#include "internal/store/version_token.hpp"

namespace airspace::store {

DependencyResolver::DependencyResolver(std::shared_ptr<db::Repository> db) : db_(std::move(db)) {
}

std::vector<std::string> DependencyResolver::DependentsOfSubscription(Scope& scope, const std::string& subscription_id) {
  const std::string ctx = "dependents of subscription " + subscription_id;
  scope.ThrowIfCancelled(ctx);
  try {
    return db_->GetDependentOperationalIntents(scope.tx(), subscription_id);
  } catch (const db::DbError& e) {
    ThrowTranslated(ctx, e);
  }
}

std::vector<model::Subscription> DependencyResolver::IncrementNotificationIndices(Scope& scope, model::SearchFilter filter) {
  const std::string ctx = "increment notification indices";
  if (filter.cells.empty()) throw util::InvalidInput(ctx + ": filter cells must not be empty");
  scope.ThrowIfCancelled(ctx);

  filter.cells = model::NormalizeCells(std::move(filter.cells));

  std::vector<model::Subscription> updated;
  ThrowIfError(ctx, db_->IncrementNotificationIndices(scope.tx(), filter, updated));

  // updated_at is untouched, so tokens are those the owners already hold.
  for (auto& sub : updated) sub.version = VersionToken::Encode(sub.updated_at, sub.id);
  return updated;
}

} // namespace airspace::store
