#include "internal/store/entity_repository.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/store/airspace_store.hpp"
#include "internal/store/version_token.hpp"
#include "internal/util/uuid.hpp"

namespace {

using airspace::db::ErrorCode;
using airspace::db::Repository;
using airspace::db::Result;
using airspace::db::Transaction;
using airspace::model::CellSet;
using airspace::model::IdentificationServiceArea;
using airspace::model::OperationalIntent;
using airspace::model::SearchFilter;
using airspace::model::Subscription;
using airspace::store::AirspaceStore;
using airspace::store::Scope;
using airspace::util::TimePoint;

const TimePoint kStart = airspace::util::FromUnixMicros(1704067200000000);
const TimePoint kEnd   = kStart + std::chrono::hours(24);

/*
  Forwards to a memory backend and misbehaves on request.
*/
class FaultyRepository final : public Repository {
 public:
  std::optional<ErrorCode> fail_reads;
  std::optional<ErrorCode> fail_writes;
  bool                     disagree_on_cells = false;
  bool                     duplicate_rows    = false;

  std::unique_ptr<Transaction> Begin() override {
    return inner_.Begin();
  }
  void Bootstrap() override {
    inner_.Bootstrap();
  }

  std::optional<IdentificationServiceArea> GetIsa(Transaction& tx, const std::string& id) override {
    MaybeFailRead();
    MaybeDuplicate(id);
    return inner_.GetIsa(tx, id);
  }
  std::vector<IdentificationServiceArea> SearchIsas(Transaction& tx, const SearchFilter& filter) override {
    MaybeFailRead();
    return inner_.SearchIsas(tx, filter);
  }
  Result UpsertIsa(Transaction& tx, IdentificationServiceArea& isa, std::optional<TimePoint> expected) override {
    if (fail_writes) return Result::Err(*fail_writes, "injected");
    return inner_.UpsertIsa(tx, isa, expected);
  }
  Result DeleteIsa(Transaction& tx, const std::string& id) override {
    return inner_.DeleteIsa(tx, id);
  }

  std::optional<Subscription> GetSubscription(Transaction& tx, const std::string& id) override {
    MaybeDuplicate(id);
    return inner_.GetSubscription(tx, id);
  }
  std::vector<Subscription> SearchSubscriptions(Transaction& tx, const SearchFilter& filter) override {
    return inner_.SearchSubscriptions(tx, filter);
  }
  std::vector<Subscription> SearchSubscriptionsByOwner(Transaction& tx, const CellSet& cells, const std::string& owner) override {
    return inner_.SearchSubscriptionsByOwner(tx, cells, owner);
  }
  int64_t MaxSubscriptionCountInCellsByOwner(Transaction& tx, const CellSet& cells, const std::string& owner) override {
    return inner_.MaxSubscriptionCountInCellsByOwner(tx, cells, owner);
  }
  Result UpsertSubscription(Transaction& tx, Subscription& sub, std::optional<TimePoint> expected) override {
    return inner_.UpsertSubscription(tx, sub, expected);
  }
  Result DeleteSubscription(Transaction& tx, const std::string& id) override {
    return inner_.DeleteSubscription(tx, id);
  }
  Result IncrementNotificationIndices(Transaction& tx, const SearchFilter& filter, std::vector<Subscription>& updated) override {
    return inner_.IncrementNotificationIndices(tx, filter, updated);
  }

  std::optional<OperationalIntent> GetOperationalIntent(Transaction& tx, const std::string& id) override {
    return inner_.GetOperationalIntent(tx, id);
  }
  CellSet ListOperationalIntentCells(Transaction& tx, const std::string& id) override {
    auto cells = inner_.ListOperationalIntentCells(tx, id);
    if (disagree_on_cells && !cells.empty()) cells.pop_back();
    return cells;
  }
  std::vector<OperationalIntent> SearchOperationalIntents(Transaction& tx, const SearchFilter& filter) override {
    return inner_.SearchOperationalIntents(tx, filter);
  }
  Result UpsertOperationalIntent(Transaction& tx, OperationalIntent& oi, std::optional<TimePoint> expected) override {
    return inner_.UpsertOperationalIntent(tx, oi, expected);
  }
  Result DeleteOperationalIntent(Transaction& tx, const std::string& id) override {
    return inner_.DeleteOperationalIntent(tx, id);
  }
  std::vector<std::string> GetDependentOperationalIntents(Transaction& tx, const std::string& subscription_id) override {
    return inner_.GetDependentOperationalIntents(tx, subscription_id);
  }

 private:
  void MaybeFailRead() {
    if (fail_reads) throw airspace::db::DbError(*fail_reads, "injected");
  }
  // What the SQL backends report when a single-row fetch returns several rows.
  void MaybeDuplicate(const std::string& id) {
    if (duplicate_rows) throw airspace::db::DbError(ErrorCode::Corruption, "multiple rows for " + id);
  }

  airspace::db::memory::MemoryRepository inner_;
};

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

IdentificationServiceArea MakeIsa(const std::string& id) {
  IdentificationServiceArea isa;
  isa.id        = id;
  isa.owner     = "uss-a";
  isa.url       = "https://uss-a.example/isa";
  isa.starts_at = kStart;
  isa.ends_at   = kEnd;
  isa.cells     = {12, 10, 11, 10};
  return isa;
}

OperationalIntent MakeOperationalIntent(const std::string& id) {
  OperationalIntent oi;
  oi.id             = id;
  oi.manager        = "uss-a";
  oi.url            = "https://uss-a.example/oi";
  oi.altitude_lower = 100;
  oi.altitude_upper = 200;
  oi.starts_at      = kStart;
  oi.ends_at        = kEnd;
  oi.cells          = {7, 8};
  return oi;
}

void TestValidationRejectsBadInput() {
  AirspaceStore store(std::make_shared<airspace::db::memory::MemoryRepository>());

  auto upsert_isa = [&](IdentificationServiceArea isa) {
    store.Run("upsert", [&](Scope& scope) { store.isas().Upsert(scope, isa, std::nullopt); });
  };

  auto no_id = MakeIsa("");
  ExpectThrows<airspace::util::InvalidInput>([&] { upsert_isa(no_id); });

  auto no_cells  = MakeIsa(airspace::util::NewId());
  no_cells.cells = {};
  ExpectThrows<airspace::util::InvalidInput>([&] { upsert_isa(no_cells); });
  ExpectThrows<airspace::util::NotFound>([&] { store.GetIsa(no_cells.id); });

  auto empty_window    = MakeIsa(airspace::util::NewId());
  empty_window.ends_at = kStart;
  ExpectThrows<airspace::util::InvalidInput>([&] { upsert_isa(empty_window); });

  auto inverted           = MakeOperationalIntent(airspace::util::NewId());
  inverted.altitude_lower = 300;
  ExpectThrows<airspace::util::InvalidInput>(
      [&] { store.Run("upsert", [&](Scope& scope) { store.operational_intents().Upsert(scope, inverted, std::nullopt); }); });

  ExpectThrows<airspace::util::InvalidInput>([&] { store.SearchIsas(SearchFilter{}); });
}

void TestUpsertReturnsNormalizedRow() {
  AirspaceStore store(std::make_shared<airspace::db::memory::MemoryRepository>());
  const auto    id = airspace::util::NewId();

  const auto isa = store.Run("create", [&](Scope& scope) { return store.isas().Upsert(scope, MakeIsa(id), std::nullopt); });
  assert((isa.cells == CellSet{10, 11, 12}));
  assert(isa.updated_at != TimePoint{});
  assert(isa.version == airspace::store::VersionToken::Encode(isa.updated_at, id));

  const auto read = store.GetIsa(id);
  assert(read.version == isa.version);
  assert(read.cells == isa.cells);
}

void TestTokensFenceWrites() {
  AirspaceStore store(std::make_shared<airspace::db::memory::MemoryRepository>());
  const auto    id = airspace::util::NewId();

  ExpectThrows<airspace::util::VersionConflict>(
      [&] { store.Run("token for missing", [&](Scope& scope) { store.isas().Upsert(scope, MakeIsa(id), std::string("anything")); }); });
  ExpectThrows<airspace::util::NotFound>([&] { store.GetIsa(id); });

  const auto token = store.Run("create", [&](Scope& scope) { return store.isas().Upsert(scope, MakeIsa(id), std::nullopt).version; });

  ExpectThrows<airspace::util::VersionConflict>(
      [&] { store.Run("garbage token", [&](Scope& scope) { store.isas().Upsert(scope, MakeIsa(id), std::string("garbage")); }); });
  ExpectThrows<airspace::util::VersionConflict>(
      [&] { store.Run("empty token", [&](Scope& scope) { store.isas().Upsert(scope, MakeIsa(id), std::string()); }); });

  const auto next = store.Run("update", [&](Scope& scope) { return store.isas().Upsert(scope, MakeIsa(id), token).version; });
  assert(next != token);
  ExpectThrows<airspace::util::VersionConflict>(
      [&] { store.Run("replay", [&](Scope& scope) { store.isas().Upsert(scope, MakeIsa(id), token); }); });
}

void TestOperationalIntentVersions() {
  AirspaceStore store(std::make_shared<airspace::db::memory::MemoryRepository>());
  const auto    id = airspace::util::NewId();

  auto oi = store.Run("create", [&](Scope& scope) { return store.operational_intents().Upsert(scope, MakeOperationalIntent(id), std::nullopt); });
  assert(oi.version == 1);

  for (int64_t expected = 2; expected <= 3; ++expected) {
    auto next  = MakeOperationalIntent(id);
    next.state = airspace::model::OperationalIntentState::kActivated;
    oi = store.Run("update", [&](Scope& scope) { return store.operational_intents().Upsert(scope, next, oi.ovn); });
    assert(oi.version == expected);
  }
  assert(store.GetOperationalIntent(id).version == 3);
}

void TestSearchIgnoresAltitudeForIsas() {
  AirspaceStore store(std::make_shared<airspace::db::memory::MemoryRepository>());
  const auto    id = airspace::util::NewId();
  store.Run("create", [&](Scope& scope) { store.isas().Upsert(scope, MakeIsa(id), std::nullopt); });

  SearchFilter filter{.cells = {11}, .altitude_lower = 10000, .altitude_upper = 20000};
  const auto   rows = store.SearchIsas(filter);
  assert(rows.size() == 1);
  assert(rows[0].id == id);
  assert(!rows[0].version.empty());

  // Unsorted, duplicated filter cells are accepted.
  assert(store.SearchIsas(SearchFilter{.cells = {99, 12, 12}}).size() == 1);
}

void TestSubscriptionUpsertKeepsNotificationIndex() {
  AirspaceStore store(std::make_shared<airspace::db::memory::MemoryRepository>());
  const auto    id = airspace::util::NewId();

  Subscription sub;
  sub.id                 = id;
  sub.owner              = "uss-a";
  sub.url                = "https://uss-a.example/notify";
  sub.starts_at          = kStart;
  sub.ends_at            = kEnd;
  sub.cells              = {5};
  sub.notification_index = 42;

  const auto created = store.Run("create", [&](Scope& scope) { return store.subscriptions().Upsert(scope, sub, std::nullopt); });
  assert(created.notification_index == 0);

  store.Run("notify", [&](Scope& scope) { store.dependencies().IncrementNotificationIndices(scope, SearchFilter{.cells = {5}}); });
  const auto updated = store.Run("update", [&](Scope& scope) { return store.subscriptions().Upsert(scope, sub, created.version); });
  assert(updated.notification_index == 1);
}

void TestCellDisagreementIsAConsistencyFault() {
  auto          repo = std::make_shared<FaultyRepository>();
  AirspaceStore store(repo);
  const auto    id = airspace::util::NewId();

  store.Run("create", [&](Scope& scope) { store.operational_intents().Upsert(scope, MakeOperationalIntent(id), std::nullopt); });
  assert(store.GetOperationalIntent(id).cells == (CellSet{7, 8}));

  repo->disagree_on_cells = true;
  ExpectThrows<airspace::util::ConsistencyFault>([&] { store.GetOperationalIntent(id); });
}

void TestDuplicateRowsAreConsistencyFaults() {
  auto          repo = std::make_shared<FaultyRepository>();
  AirspaceStore store(repo);
  const auto    isa_id = airspace::util::NewId();
  const auto    sub_id = airspace::util::NewId();

  Subscription sub;
  sub.id    = sub_id;
  sub.owner = "uss-a";
  sub.url   = "https://uss-a.example/notify";
  sub.cells = {5};

  store.Run("create", [&](Scope& scope) {
    store.isas().Upsert(scope, MakeIsa(isa_id), std::nullopt);
    store.subscriptions().Upsert(scope, sub, std::nullopt);
  });

  repo->duplicate_rows = true;
  ExpectThrows<airspace::util::ConsistencyFault>([&] { store.GetIsa(isa_id); });
  ExpectThrows<airspace::util::ConsistencyFault>([&] { store.GetSubscription(sub_id); });
  // Writes read the current row first and stop there too.
  ExpectThrows<airspace::util::ConsistencyFault>(
      [&] { store.Run("update", [&](Scope& scope) { store.subscriptions().Upsert(scope, sub, std::nullopt); }); });

  repo->duplicate_rows = false;
  assert(store.GetSubscription(sub_id).id == sub_id);
}

void TestOwnerIsFixedOnceTokenPresented() {
  AirspaceStore store(std::make_shared<airspace::db::memory::MemoryRepository>());
  const auto    isa_id = airspace::util::NewId();
  const auto    oi_id  = airspace::util::NewId();

  const auto isa = store.Run("create isa", [&](Scope& scope) { return store.isas().Upsert(scope, MakeIsa(isa_id), std::nullopt); });
  const auto oi =
      store.Run("create oi", [&](Scope& scope) { return store.operational_intents().Upsert(scope, MakeOperationalIntent(oi_id), std::nullopt); });

  auto moved  = MakeIsa(isa_id);
  moved.owner = "uss-b";
  ExpectThrows<airspace::util::InvalidInput>([&] { store.Run("take over isa", [&](Scope& scope) { store.isas().Upsert(scope, moved, isa.version); }); });

  auto handed_over    = MakeOperationalIntent(oi_id);
  handed_over.manager = "uss-b";
  ExpectThrows<airspace::util::InvalidInput>(
      [&] { store.Run("take over oi", [&](Scope& scope) { store.operational_intents().Upsert(scope, handed_over, oi.ovn); }); });

  assert(store.GetIsa(isa_id).owner == "uss-a");
  assert(store.GetOperationalIntent(oi_id).manager == "uss-a");
  assert(store.GetOperationalIntent(oi_id).version == 1);

  // The original token is still good for an update that keeps the owner.
  store.Run("update isa", [&](Scope& scope) { store.isas().Upsert(scope, MakeIsa(isa_id), isa.version); });
}

void TestBackendFailuresAreTranslated() {
  auto          repo = std::make_shared<FaultyRepository>();
  AirspaceStore store(repo);
  const auto    id = airspace::util::NewId();

  repo->fail_reads = ErrorCode::IOError;
  try {
    store.GetIsa(id);
    assert(false);
  } catch (const airspace::util::BackingStoreFault& e) {
    assert(e.code() == "IO_ERROR");
    assert(std::string(e.what()).find(id) != std::string::npos);
  }
  repo->fail_reads.reset();

  repo->fail_writes = ErrorCode::ConstraintViolation;
  ExpectThrows<airspace::util::InvalidInput>(
      [&] { store.Run("create", [&](Scope& scope) { store.isas().Upsert(scope, MakeIsa(id), std::nullopt); }); });

  repo->fail_writes = ErrorCode::SerializationFailure;
  try {
    store.Run("create", [&](Scope& scope) { store.isas().Upsert(scope, MakeIsa(id), std::nullopt); });
    assert(false);
  } catch (const airspace::util::BackingStoreFault& e) {
    assert(e.code() == "SERIALIZATION_FAILURE");
  }
}

void TestOwnerQueriesRejectEmptyCells() {
  AirspaceStore store(std::make_shared<airspace::db::memory::MemoryRepository>());
  store.Run("owner queries", [&](Scope& scope) {
    ExpectThrows<airspace::util::InvalidInput>([&] { store.subscriptions().SearchByOwner(scope, {}, "uss-a"); });
    ExpectThrows<airspace::util::InvalidInput>([&] { store.subscriptions().MaxCountInCellsByOwner(scope, {}, "uss-a"); });
    assert(store.subscriptions().MaxCountInCellsByOwner(scope, {1}, "uss-a") == 0);
  });
}

} // namespace

int main() {
  TestValidationRejectsBadInput();
  TestUpsertReturnsNormalizedRow();
  TestTokensFenceWrites();
  TestOperationalIntentVersions();
  TestSearchIgnoresAltitudeForIsas();
  TestSubscriptionUpsertKeepsNotificationIndex();
  TestCellDisagreementIsAConsistencyFault();
  TestDuplicateRowsAreConsistencyFaults();
  TestOwnerIsFixedOnceTokenPresented();
  TestBackendFailuresAreTranslated();
  TestOwnerQueriesRejectEmptyCells();

  std::cout << "airspace_unit_entity_repository: pass\n";
  return 0;
}
