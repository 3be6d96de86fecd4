#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/store/transaction_coordinator.hpp"

namespace airspace::store {

/*
  Links between operational intents and the subscriptions that watch them.
*/
class DependencyResolver {
 public:
  explicit DependencyResolver(std::shared_ptr<db::Repository> db);

  // Ids of operational intents whose subscription_id is subscription_id.
  // Empty when none (the subscription need not exist).
  std::vector<std::string> DependentsOfSubscription(Scope& scope, const std::string& subscription_id);

  // Bumps notification_index of every subscription overlapping the filter's
  // cells and time window, returning them with their new index and token.
  std::vector<model::Subscription> IncrementNotificationIndices(Scope& scope, model::SearchFilter filter);

 private:
  std::shared_ptr<db::Repository> db_;
};

} // namespace airspace::store
