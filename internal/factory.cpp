#include "factory.hpp"

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/observability/logging.hpp"
#if AIRSPACE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if AIRSPACE_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace airspace::factory {

namespace {

constexpr std::chrono::milliseconds kDefaultBusyTimeout{5000};
constexpr std::size_t               kDefaultMaxConnections = 16;

std::chrono::milliseconds BusyTimeout(std::uint32_t configured_ms) {
  return configured_ms == 0 ? kDefaultBusyTimeout : std::chrono::milliseconds(configured_ms);
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const airspace::runtime::config::DatabaseConfig& database) {
  if (database.has_sqlite()) {
#if AIRSPACE_DB_SQLITE
    if (database.sqlite().path().empty()) throw std::runtime_error("database.sqlite.path must be set");
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), BusyTimeout(database.sqlite().busy_timeout_ms()));
    observability::LogInfo("using sqlite backend", {observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if AIRSPACE_DB_POSTGRES
    if (database.postgres().conninfo().empty()) throw std::runtime_error("database.postgres.conninfo must be set");
    const std::size_t max_connections =
        database.postgres().max_connections() == 0 ? kDefaultMaxConnections : database.postgres().max_connections();
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().conninfo(), max_connections);
    observability::LogInfo("using postgres backend", {observability::IntField("max_connections", static_cast<std::int64_t>(max_connections))});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  observability::LogInfo("using memory backend");
  return std::make_shared<db::memory::MemoryRepository>(BusyTimeout(database.memory().busy_timeout_ms()));
}

geo::CoveringPolicy CoveringPolicyFromConfig(const airspace::runtime::config::CoveringConfig& covering) {
  geo::CoveringPolicy policy;
  if (covering.min_level() != 0) policy.min_level = covering.min_level();
  if (covering.max_level() != 0) policy.max_level = covering.max_level();
  if (covering.level_mod() != 0) policy.level_mod = covering.level_mod();
  if (covering.max_cells() != 0) policy.max_cells = covering.max_cells();
  if (covering.max_area_km2() != 0) policy.max_area_km2 = covering.max_area_km2();

  if (policy.min_level < 0 || policy.max_level > 30 || policy.min_level > policy.max_level) {
    throw std::runtime_error("covering: levels must satisfy 0 <= min_level <= max_level <= 30");
  }
  if (policy.level_mod < 1 || policy.level_mod > 3) throw std::runtime_error("covering: level_mod must be 1, 2 or 3");
  if (policy.max_cells < 1) throw std::runtime_error("covering: max_cells must be positive");
  if (policy.max_area_km2 <= 0) throw std::runtime_error("covering: max_area_km2 must be positive");
  return policy;
}

/*
    Build full runtime graph
*/
Runtime Build(const airspace::runtime::config::RuntimeConfig& config) {
  const geo::CoveringPolicy policy = CoveringPolicyFromConfig(config.covering());

  Runtime runtime;
  runtime.repository = BuildRepository(config.database());
#if AIRSPACE_GEO_S2
  runtime.covering = std::make_shared<const geo::CoveringEngine>(policy);
  runtime.store    = std::make_shared<store::AirspaceStore>(runtime.repository, runtime.covering);
  observability::LogInfo("covering engine ready", {observability::IntField("min_level", policy.min_level),
                                                   observability::IntField("max_level", policy.max_level),
                                                   observability::IntField("max_cells", policy.max_cells)});
#else
  runtime.store = std::make_shared<store::AirspaceStore>(runtime.repository);
  observability::LogInfo("covering engine not built; volume searches are unavailable",
                         {observability::IntField("min_level", policy.min_level), observability::IntField("max_level", policy.max_level)});
#endif

  if (config.database().bootstrap_on_start()) {
    runtime.store->Bootstrap();
  }
  return runtime;
}

} // namespace airspace::factory
