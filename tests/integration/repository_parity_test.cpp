#include <algorithm>
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <future>
#include <iostream>
#include <memory>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/store/airspace_store.hpp"
#include "internal/store/version_token.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

#if AIRSPACE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if AIRSPACE_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using airspace::db::Repository;
using airspace::db::memory::MemoryRepository;
using airspace::model::CellSet;
using airspace::model::IdentificationServiceArea;
using airspace::model::OperationalIntent;
using airspace::model::OperationalIntentState;
using airspace::model::SearchFilter;
using airspace::model::Subscription;
using airspace::store::AirspaceStore;
using airspace::store::Scope;
using airspace::util::FromUnixMicros;
using airspace::util::TimePoint;

// 2024-01-01T00:00:00Z
const TimePoint kJan1 = FromUnixMicros(1704067200000000);
const TimePoint kJan2 = kJan1 + std::chrono::hours(24);

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  bool                                              supports_parallel_transactions = true;
};

// A persistent postgres database keeps rows of earlier runs; every run works
// in cells of its own.
int64_t RunCellBase() {
  static const int64_t base = [] {
    std::mt19937_64                        rng(std::random_device{}());
    std::uniform_int_distribution<int64_t> dist(1, 1'000'000'000);
    return dist(rng) * 1000;
  }();
  return base;
}

CellSet Cells(std::initializer_list<int64_t> offsets) {
  CellSet out;
  for (auto offset : offsets) out.push_back(RunCellBase() + offset);
  return out;
}

template <typename Ex, typename Fn>
void ExpectThrows(Fn&& fn) {
  bool threw = false;
  try {
    fn();
  } catch (const Ex&) {
    threw = true;
  }
  assert(threw);
}

template <typename Record>
bool ContainsId(const std::vector<Record>& rows, const std::string& id) {
  for (const auto& row : rows) {
    if (row.id == id) return true;
  }
  return false;
}

IdentificationServiceArea MakeIsa(const std::string& id, CellSet cells) {
  IdentificationServiceArea isa;
  isa.id        = id;
  isa.owner     = "uss-a";
  isa.url       = "https://uss-a.example/isa";
  isa.starts_at = kJan1;
  isa.ends_at   = kJan2;
  isa.cells     = std::move(cells);
  return isa;
}

Subscription MakeSubscription(const std::string& id, const std::string& owner, CellSet cells) {
  Subscription sub;
  sub.id        = id;
  sub.owner     = owner;
  sub.url       = "https://" + owner + ".example/notify";
  sub.starts_at = kJan1;
  sub.ends_at   = kJan2;
  sub.cells     = std::move(cells);
  return sub;
}

OperationalIntent MakeOperationalIntent(const std::string& id, CellSet cells) {
  OperationalIntent oi;
  oi.id             = id;
  oi.manager        = "uss-a";
  oi.url            = "https://uss-a.example/oi";
  oi.altitude_lower = 0;
  oi.altitude_upper = 500;
  oi.starts_at      = kJan1;
  oi.ends_at        = kJan2;
  oi.state          = OperationalIntentState::kAccepted;
  oi.cells          = std::move(cells);
  return oi;
}

void VerifyBootstrapIsIdempotent(Repository& repo, AirspaceStore& store) {
  repo.Bootstrap();
  store.Bootstrap();

  const auto id = airspace::util::NewId();
  store.Run("seed", [&](Scope& scope) { store.isas().Upsert(scope, MakeIsa(id, Cells({1})), std::nullopt); });
  store.Bootstrap();
  assert(store.GetIsa(id).id == id);
}

void VerifyIsaLifecycle(AirspaceStore& store) {
  const auto id = airspace::util::NewId();

  auto created = store.Run("create isa", [&](Scope& scope) { return store.isas().Upsert(scope, MakeIsa(id, Cells({10, 11, 12})), std::nullopt); });
  assert(!created.version.empty());
  assert(created.cells == Cells({10, 11, 12}));

  auto read = store.GetIsa(id);
  assert(read.starts_at == kJan1);
  assert(read.ends_at == kJan2);
  assert(read.owner == "uss-a");
  assert(read.cells == Cells({10, 11, 12}));
  assert(read.version == created.version);
  assert(read.updated_at == created.updated_at);

  // A second read of the unmodified row yields the same token.
  assert(store.GetIsa(id).version == read.version);

  auto changed = MakeIsa(id, Cells({10, 11, 12}));
  changed.url  = "https://uss-a.example/isa/v2";
  auto updated = store.Run("update isa", [&](Scope& scope) { return store.isas().Upsert(scope, changed, read.version); });
  assert(updated.version != read.version);
  assert(updated.updated_at > read.updated_at);
  assert(store.GetIsa(id).url == "https://uss-a.example/isa/v2");

  // The first token is stale now.
  ExpectThrows<airspace::util::VersionConflict>(
      [&] { store.Run("stale update isa", [&](Scope& scope) { store.isas().Upsert(scope, MakeIsa(id, Cells({10})), read.version); }); });
  assert(store.GetIsa(id).url == "https://uss-a.example/isa/v2");
}

void VerifyVersionFencing(AirspaceStore& store) {
  const auto id = airspace::util::NewId();
  const auto t0 = store.Run("seed", [&](Scope& scope) { return store.isas().Upsert(scope, MakeIsa(id, Cells({20})), std::nullopt); }).version;

  auto first = MakeIsa(id, Cells({20}));
  first.url  = "https://first.example";
  store.Run("first writer", [&](Scope& scope) { store.isas().Upsert(scope, first, t0); });

  auto second = MakeIsa(id, Cells({20}));
  second.url  = "https://second.example";
  ExpectThrows<airspace::util::VersionConflict>([&] { store.Run("second writer", [&](Scope& scope) { store.isas().Upsert(scope, second, t0); }); });

  assert(store.GetIsa(id).url == "https://first.example");

  // A token for a row that does not exist never creates it.
  const auto missing = airspace::util::NewId();
  ExpectThrows<airspace::util::VersionConflict>(
      [&] { store.Run("token for missing row", [&](Scope& scope) { store.isas().Upsert(scope, MakeIsa(missing, Cells({20})), t0); }); });
  ExpectThrows<airspace::util::NotFound>([&] { store.GetIsa(missing); });
}

void VerifyRelaxedUpsertReplaces(AirspaceStore& store) {
  const auto id    = airspace::util::NewId();
  const auto first = store.Run("create", [&](Scope& scope) { return store.isas().Upsert(scope, MakeIsa(id, Cells({25})), std::nullopt); });

  auto replacement  = MakeIsa(id, Cells({26, 25}));
  replacement.owner = "uss-b";
  const auto second = store.Run("replace", [&](Scope& scope) { return store.isas().Upsert(scope, replacement, std::nullopt); });
  assert(second.updated_at > first.updated_at);
  assert(second.cells == Cells({25, 26}));

  const auto read = store.GetIsa(id);
  assert(read.owner == "uss-b");
  assert(read.cells == Cells({25, 26}));
}

void VerifySearchMatching(AirspaceStore& store) {
  const auto id = airspace::util::NewId();
  store.Run("create oi", [&](Scope& scope) { store.operational_intents().Upsert(scope, MakeOperationalIntent(id, Cells({100, 101})), std::nullopt); });

  SearchFilter overlapping{.cells = Cells({101, 200}), .altitude_lower = 400, .altitude_upper = 600};
  assert(ContainsId(store.SearchOperationalIntents(overlapping), id));

  SearchFilter other_cells{.cells = Cells({300})};
  assert(!ContainsId(store.SearchOperationalIntents(other_cells), id));

  SearchFilter above{.cells = Cells({100}), .altitude_lower = 600, .altitude_upper = 700};
  assert(!ContainsId(store.SearchOperationalIntents(above), id));

  // Touching altitude bounds overlap.
  SearchFilter touching{.cells = Cells({100}), .altitude_lower = 500, .altitude_upper = 700};
  assert(ContainsId(store.SearchOperationalIntents(touching), id));

  SearchFilter later{.cells = Cells({100}), .starts_at = kJan2 + std::chrono::hours(1)};
  assert(!ContainsId(store.SearchOperationalIntents(later), id));

  // Unbounded filter on the shared cell.
  for (const auto& oi : store.SearchOperationalIntents(SearchFilter{.cells = Cells({100})})) {
    assert(!oi.ovn.empty());
    assert(!oi.cells.empty());
  }
}

void VerifyTimeBoundary(AirspaceStore& store) {
  const auto id = airspace::util::NewId();
  store.Run("create isa", [&](Scope& scope) { store.isas().Upsert(scope, MakeIsa(id, Cells({30})), std::nullopt); });

  SearchFilter at_end{.cells = Cells({30}), .starts_at = kJan2};
  assert(ContainsId(store.SearchIsas(at_end), id));

  SearchFilter after_end{.cells = Cells({30}), .starts_at = kJan2 + std::chrono::microseconds(1)};
  assert(!ContainsId(store.SearchIsas(after_end), id));

  SearchFilter before_start{.cells = Cells({30}), .ends_at = kJan1 - std::chrono::microseconds(1)};
  assert(!ContainsId(store.SearchIsas(before_start), id));

  SearchFilter at_start{.cells = Cells({30}), .ends_at = kJan1};
  assert(ContainsId(store.SearchIsas(at_start), id));
}

void VerifyDeleteMissing(AirspaceStore& store) {
  const auto id = airspace::util::NewId();
  store.Run("create", [&](Scope& scope) { store.subscriptions().Upsert(scope, MakeSubscription(id, "uss-a", Cells({40})), std::nullopt); });
  store.Run("delete", [&](Scope& scope) { store.subscriptions().Delete(scope, id); });

  for (int i = 0; i < 2; ++i) {
    ExpectThrows<airspace::util::NotFound>([&] { store.Run("delete again", [&](Scope& scope) { store.subscriptions().Delete(scope, id); }); });
  }
  ExpectThrows<airspace::util::NotFound>([&] { store.GetSubscription(id); });
}

void VerifyOperationalIntentCells(Repository& repo, AirspaceStore& store) {
  const auto id      = airspace::util::NewId();
  const auto created = store.Run("create oi", [&](Scope& scope) {
    return store.operational_intents().Upsert(scope, MakeOperationalIntent(id, Cells({52, 50, 51, 50})), std::nullopt);
  });
  assert(created.version == 1);
  assert(created.cells == Cells({50, 51, 52}));
  assert(!created.ovn.empty());

  auto tx = repo.Begin();
  auto row = repo.GetOperationalIntent(*tx, id);
  assert(row.has_value());
  assert(row->cells == repo.ListOperationalIntentCells(*tx, id));
  tx->Commit();

  auto next  = MakeOperationalIntent(id, Cells({53}));
  next.state = OperationalIntentState::kActivated;
  const auto updated = store.Run("update oi", [&](Scope& scope) { return store.operational_intents().Upsert(scope, next, created.ovn); });
  assert(updated.version == 2);
  assert(updated.ovn != created.ovn);

  const auto read = store.GetOperationalIntent(id);
  assert(read.state == OperationalIntentState::kActivated);
  assert(read.cells == Cells({53}));
  assert(read.ovn == updated.ovn);
  assert(read.altitude_lower == 0.0);
  assert(read.altitude_upper == 500.0);
}

void VerifyDependents(AirspaceStore& store) {
  const auto sub_id = airspace::util::NewId();
  const auto a      = airspace::util::NewId();
  const auto b      = airspace::util::NewId();

  store.Run("create", [&](Scope& scope) {
    store.subscriptions().Upsert(scope, MakeSubscription(sub_id, "uss-a", Cells({60})), std::nullopt);
    for (const auto& id : {a, b}) {
      auto oi            = MakeOperationalIntent(id, Cells({60}));
      oi.subscription_id = sub_id;
      store.operational_intents().Upsert(scope, oi, std::nullopt);
    }
  });

  auto dependents = store.DependentsOfSubscription(sub_id);
  std::vector<std::string> expected{a, b};
  std::sort(expected.begin(), expected.end());
  assert(dependents == expected);

  // The reference is weak: deleting the subscription leaves the intents alone.
  store.Run("delete sub", [&](Scope& scope) { store.subscriptions().Delete(scope, sub_id); });
  assert(store.DependentsOfSubscription(sub_id).size() == 2);
  assert(store.GetOperationalIntent(a).subscription_id == sub_id);

  assert(store.DependentsOfSubscription(airspace::util::NewId()).empty());
}

void VerifyNotificationIndices(AirspaceStore& store) {
  const auto inside  = airspace::util::NewId();
  const auto outside = airspace::util::NewId();

  auto created = store.Run("create", [&](Scope& scope) {
    store.subscriptions().Upsert(scope, MakeSubscription(outside, "uss-b", Cells({71})), std::nullopt);
    return store.subscriptions().Upsert(scope, MakeSubscription(inside, "uss-a", Cells({70})), std::nullopt);
  });
  assert(created.notification_index == 0);

  SearchFilter filter{.cells = Cells({70}), .starts_at = kJan1, .ends_at = kJan2};
  auto bumped = store.Run("notify", [&](Scope& scope) { return store.dependencies().IncrementNotificationIndices(scope, filter); });
  assert(ContainsId(bumped, inside));
  assert(!ContainsId(bumped, outside));

  const auto read = store.GetSubscription(inside);
  assert(read.notification_index == 1);
  assert(read.version == created.version);
  assert(store.GetSubscription(outside).notification_index == 0);

  // Upserts keep the stored index.
  auto resubmitted = MakeSubscription(inside, "uss-a", Cells({70}));
  store.Run("update sub", [&](Scope& scope) { store.subscriptions().Upsert(scope, resubmitted, read.version); });
  assert(store.GetSubscription(inside).notification_index == 1);

  SearchFilter past{.cells = Cells({70}), .starts_at = kJan1 - std::chrono::hours(48), .ends_at = kJan1 - std::chrono::hours(24)};
  store.Run("notify past", [&](Scope& scope) { store.dependencies().IncrementNotificationIndices(scope, past); });
  assert(store.GetSubscription(inside).notification_index == 1);
}

void VerifyOwnerQueries(AirspaceStore& store) {
  const std::string owner = "owner-" + airspace::util::NewId();
  const std::string other = "owner-" + airspace::util::NewId();

  store.Run("create", [&](Scope& scope) {
    store.subscriptions().Upsert(scope, MakeSubscription(airspace::util::NewId(), owner, Cells({80, 81})), std::nullopt);
    store.subscriptions().Upsert(scope, MakeSubscription(airspace::util::NewId(), owner, Cells({81, 82})), std::nullopt);
    store.subscriptions().Upsert(scope, MakeSubscription(airspace::util::NewId(), other, Cells({81})), std::nullopt);
  });

  store.Run("owner queries", [&](Scope& scope) {
    assert(store.subscriptions().MaxCountInCellsByOwner(scope, Cells({80, 81, 82}), owner) == 2);
    assert(store.subscriptions().MaxCountInCellsByOwner(scope, Cells({80}), owner) == 1);
    assert(store.subscriptions().MaxCountInCellsByOwner(scope, Cells({83}), owner) == 0);

    auto mine = store.subscriptions().SearchByOwner(scope, Cells({82}), owner);
    assert(mine.size() == 1);
    assert(mine[0].owner == owner);
    assert(store.subscriptions().SearchByOwner(scope, Cells({80, 82}), other).empty());
  });
}

void VerifyRollbackBehavior(AirspaceStore& store) {
  const auto id = airspace::util::NewId();
  ExpectThrows<std::runtime_error>([&] {
    store.Run("failing", [&](Scope& scope) {
      store.isas().Upsert(scope, MakeIsa(id, Cells({90})), std::nullopt);
      throw std::runtime_error("caller failure");
    });
  });
  ExpectThrows<airspace::util::NotFound>([&] { store.GetIsa(id); });

  // A later failure inside the same scope undoes the earlier writes too.
  const auto kept = airspace::util::NewId();
  store.Run("seed", [&](Scope& scope) { store.isas().Upsert(scope, MakeIsa(kept, Cells({91})), std::nullopt); });
  ExpectThrows<airspace::util::VersionConflict>([&] {
    store.Run("partial", [&](Scope& scope) {
      store.isas().Delete(scope, kept);
      store.isas().Upsert(scope, MakeIsa(id, Cells({91})), "bogus-token");
    });
  });
  assert(store.GetIsa(kept).id == kept);
}

void VerifyConcurrentWriters(Repository& repo, AirspaceStore& store, bool supports_parallel_transactions) {
  const auto id = airspace::util::NewId();
  const auto t0 = store.Run("seed", [&](Scope& scope) { return store.isas().Upsert(scope, MakeIsa(id, Cells({95})), std::nullopt); }).version;

  if (!supports_parallel_transactions) {
    // Transactions are serialized; a second one waits out the busy timeout.
    auto held   = repo.Begin();
    auto second = std::async(std::launch::async, [&repo] {
      try {
        repo.Begin();
      } catch (const airspace::db::DbError& e) {
        return e.code();
      }
      return airspace::db::ErrorCode::OK;
    });
    assert(second.get() == airspace::db::ErrorCode::Busy);
    held->Rollback();

    ExpectThrows<airspace::util::BackingStoreFault>([&] {
      auto blocker = repo.Begin();
      std::async(std::launch::async, [&store] { store.GetIsa("any"); }).get();
    });
    return;
  }

  // Both writers read the same row; the guarded update lets only one through.
  auto tx1 = repo.Begin();
  auto tx2 = repo.Begin();
  auto r1  = repo.GetIsa(*tx1, id);
  auto r2  = repo.GetIsa(*tx2, id);
  assert(r1 && r2);
  assert(airspace::store::VersionToken::Validate(t0, r1->updated_at, id));

  const auto expected = r1->updated_at;
  r1->url = "https://one.example";
  assert(repo.UpsertIsa(*tx1, *r1, expected));
  tx1->Commit();

  r2->url  = "https://two.example";
  auto res = repo.UpsertIsa(*tx2, *r2, expected);
  assert(!res);
  tx2->Rollback();

  assert(store.GetIsa(id).url == "https://one.example");
}

void VerifyRestartDurability(BackendFactory& backend) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  repo->Bootstrap();

  const auto id = airspace::util::NewId();
  std::string token;
  {
    AirspaceStore store(repo);
    token = store.Run("create", [&](Scope& scope) {
                   return store.operational_intents().Upsert(scope, MakeOperationalIntent(id, Cells({110, 111})), std::nullopt);
                 }).ovn;
  }

  backend.restart(repo);

  AirspaceStore store(repo);
  store.Bootstrap();
  const auto read = store.GetOperationalIntent(id);
  assert(read.ovn == token);
  assert(read.cells == Cells({110, 111}));
  assert(read.version == 1);

  backend.cleanup();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                           = "memory",
      .make_repository                = []() { return std::make_shared<MemoryRepository>(std::chrono::milliseconds(200)); },
      .supports_restart               = []() { return false; },
      .restart                        = [](std::shared_ptr<Repository>&) {},
      .cleanup                        = []() {},
      .supports_parallel_transactions = false,
  };
}

#if AIRSPACE_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("airspace_integration_sqlite_" + airspace::util::NewId() + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<airspace::db::sqlite::SqliteDB>(db_path, std::chrono::milliseconds(200));
    return std::shared_ptr<Repository>(std::make_shared<airspace::db::sqlite::SqliteRepository>(std::move(db)));
  };

  return BackendFactory{
      .name                           = "sqlite",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup =
          [db_path]() {
            std::filesystem::remove(db_path);
            std::filesystem::remove(db_path + "-wal");
            std::filesystem::remove(db_path + "-shm");
          },
      .supports_parallel_transactions = false,
  };
}
#endif

#if AIRSPACE_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* conninfo = std::getenv("AIRSPACE_TEST_POSTGRES_CONNINFO");
  if (conninfo == nullptr || std::string(conninfo).empty()) {
    throw std::runtime_error("AIRSPACE_TEST_POSTGRES_CONNINFO is not set");
  }
  const std::string dsn = conninfo;

  auto make_repo = [dsn]() {
    auto pool = std::make_shared<airspace::db::postgres::PgPool>(dsn, 4);
    return std::shared_ptr<Repository>(std::make_shared<airspace::db::postgres::PgRepository>(std::move(pool)));
  };

  return BackendFactory{
      .name                           = "postgres",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}

// Values that do not convert surface as Corruption, not as driver exceptions.
void VerifyPostgresFieldConversion(const std::string& dsn) {
  pqxx::connection     conn(dsn);
  pqxx::nontransaction work(conn);
  const auto           res = work.exec("SELECT 'not a number'::text AS a, '1.5 km'::text AS b, 42::bigint AS c, 2.5::float8 AS d");

  try {
    airspace::db::postgres::FieldToInt64(res[0][0]);
    assert(false);
  } catch (const airspace::db::DbError& e) {
    assert(e.code() == airspace::db::ErrorCode::Corruption);
  }
  try {
    airspace::db::postgres::FieldToDouble(res[0][1]);
    assert(false);
  } catch (const airspace::db::DbError& e) {
    assert(e.code() == airspace::db::ErrorCode::Corruption);
  }

  assert(airspace::db::postgres::FieldToInt64(res[0][2]) == 42);
  assert(airspace::db::postgres::FieldToDouble(res[0][3]) == 2.5);
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  auto repo = backend.make_repository();
  repo->Bootstrap();
  AirspaceStore store(repo);

  VerifyBootstrapIsIdempotent(*repo, store);
  VerifyIsaLifecycle(store);
  VerifyVersionFencing(store);
  VerifyRelaxedUpsertReplaces(store);
  VerifySearchMatching(store);
  VerifyTimeBoundary(store);
  VerifyDeleteMissing(store);
  VerifyOperationalIntentCells(*repo, store);
  VerifyDependents(store);
  VerifyNotificationIndices(store);
  VerifyOwnerQueries(store);
  VerifyRollbackBehavior(store);
  VerifyConcurrentWriters(*repo, store, backend.supports_parallel_transactions);
  VerifyRestartDurability(backend);
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if AIRSPACE_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if AIRSPACE_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& e) {
    std::cout << "skipping postgres integration suite: " << e.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
    std::cout << "repository_parity_test[" << backend.name << "]: pass\n";
  }

#if AIRSPACE_DB_POSTGRES
  if (const char* dsn = std::getenv("AIRSPACE_TEST_POSTGRES_CONNINFO"); dsn != nullptr && *dsn != '\0') {
    VerifyPostgresFieldConversion(dsn);
    std::cout << "repository_parity_test[postgres field conversion]: pass\n";
  }
#endif

  return 0;
}
