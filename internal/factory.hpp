#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/db/api/repository.hpp"
#include "internal/geo/covering.hpp"
#include "internal/store/airspace_store.hpp"

namespace airspace::factory {

/*
  Runtime

  Owns the long-lived objects built from configuration.
*/
struct Runtime {
  std::shared_ptr<db::Repository>       repository;
  std::shared_ptr<store::AirspaceStore> store;
#if AIRSPACE_GEO_S2
  // Shared with the store's volume searches.
  std::shared_ptr<const geo::CoveringEngine> covering;
#endif
};

/*
  Build

  Constructs the store based on runtime config and, when
  database.bootstrap_on_start is set, bootstraps its schema.

  NOTE:
  This is the composition root. It is the ONLY place allowed to know
  concrete DB types.
*/
Runtime Build(const airspace::runtime::config::RuntimeConfig& config);

std::shared_ptr<db::Repository> BuildRepository(const airspace::runtime::config::DatabaseConfig& database);

// Zero-valued fields keep the CoveringPolicy defaults.
geo::CoveringPolicy CoveringPolicyFromConfig(const airspace::runtime::config::CoveringConfig& covering);

} // namespace airspace::factory
