#include "memory_repository.hpp"

#include <algorithm>
#include <functional>
#include <unordered_map>

#include "internal/observability/logging.hpp"
#include "memory_tx.hpp"

namespace airspace::db::memory {

namespace {

MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// later of the clock and previous + 1us
util::TimePoint NextUpdatedAt(const std::optional<util::TimePoint>& previous) {
  const auto now = util::Now();
  if (!previous) return now;
  return std::max(now, *previous + std::chrono::microseconds(1));
}

// Mirrors the CHECK constraints of the SQL schemas.
template <typename Record>
Result CheckRow(const Record& r) {
  if (r.cells.empty()) return Result::Err(ErrorCode::ConstraintViolation, "cells must not be empty");
  if (r.starts_at && r.ends_at && !(*r.starts_at < *r.ends_at)) {
    return Result::Err(ErrorCode::ConstraintViolation, "starts_at must precede ends_at");
  }
  return Result::Ok();
}

template <typename Optional, typename Cmp>
bool Unbounded(const Optional& a, const Optional& b, Cmp cmp) {
  return !a || !b || cmp(*a, *b);
}

template <typename Record>
bool MatchesWindow(const Record& r, const model::SearchFilter& f) {
  return Unbounded(r.ends_at, f.starts_at, std::greater_equal<>()) && Unbounded(r.starts_at, f.ends_at, std::less_equal<>());
}

bool Matches(const model::IdentificationServiceArea& r, const model::SearchFilter& f) {
  return model::CellsIntersect(r.cells, f.cells) && MatchesWindow(r, f);
}

bool Matches(const model::Subscription& r, const model::SearchFilter& f) {
  return model::CellsIntersect(r.cells, f.cells) && MatchesWindow(r, f);
}

bool Matches(const model::OperationalIntent& r, const model::SearchFilter& f) {
  return model::CellsIntersect(r.cells, f.cells) && Unbounded(r.altitude_upper, f.altitude_lower, std::greater_equal<>()) &&
         Unbounded(r.altitude_lower, f.altitude_upper, std::less_equal<>()) && MatchesWindow(r, f);
}

template <typename Record>
std::optional<Record> Find(const std::map<std::string, Record>& rows, const std::string& id) {
  auto it = rows.find(id);
  if (it == rows.end()) return std::nullopt;
  return it->second;
}

template <typename Record>
std::vector<Record> Search(const std::map<std::string, Record>& rows, const model::SearchFilter& filter) {
  std::vector<Record> out;
  for (const auto& [_, r] : rows) {
    if (Matches(r, filter)) out.push_back(r);
  }
  return out;
}

/*
  Shared write path. `assign` copies the store-owned fields of the previous
  row (if any) into the incoming one before it replaces the stored row.
*/
template <typename Record, typename Assign>
Result Write(std::map<std::string, Record>& rows, Record& record, std::optional<util::TimePoint> expected_updated_at, Assign assign) {
  record.cells = model::NormalizeCells(std::move(record.cells));
  if (auto check = CheckRow(record); !check) return check;

  auto                           it = rows.find(record.id);
  std::optional<util::TimePoint> previous;
  if (it != rows.end()) previous = it->second.updated_at;

  if (expected_updated_at) {
    if (!previous) return Result::Err(ErrorCode::NotFound, "no row with id " + record.id);
    if (*previous != *expected_updated_at) return Result::Err(ErrorCode::Conflict, "row " + record.id + " was modified concurrently");
  }

  assign(record, it == rows.end() ? nullptr : &it->second);
  record.updated_at = NextUpdatedAt(previous);
  rows[record.id]   = record;
  return Result::Ok();
}

template <typename Record>
Result Erase(std::map<std::string, Record>& rows, const std::string& id) {
  if (rows.erase(id) == 0) return Result::Err(ErrorCode::NotFound, "no row with id " + id);
  return Result::Ok();
}

// Write paths report through Result; the transaction throws once interrupted.
template <typename Fn>
Result Guarded(Fn&& fn) {
  try {
    return fn();
  } catch (const DbError& e) {
    return Result::Err(e.code(), e.what());
  }
}

} // namespace

MemoryRepository::MemoryRepository(std::chrono::milliseconds busy_timeout) : busy_timeout_(busy_timeout) {
}

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

void MemoryRepository::Bootstrap() {
  AIRSPACE_LOG_INFO("schema bootstrapped", {observability::StringField("backend", "memory")});
}

// ------------------------------------------------------------------
// Identification Service Areas
// ------------------------------------------------------------------

std::optional<model::IdentificationServiceArea> MemoryRepository::GetIsa(Transaction& t, const std::string& id) {
  return Find(TX(t).Mutable().isas, id);
}

std::vector<model::IdentificationServiceArea> MemoryRepository::SearchIsas(Transaction& t, const model::SearchFilter& filter) {
  return Search(TX(t).Mutable().isas, filter);
}

Result MemoryRepository::UpsertIsa(Transaction& t, model::IdentificationServiceArea& isa, std::optional<util::TimePoint> expected_updated_at) {
  return Guarded([&] {
    return Write(TX(t).Mutable().isas, isa, expected_updated_at, [](model::IdentificationServiceArea&, const model::IdentificationServiceArea*) {});
  });
}

Result MemoryRepository::DeleteIsa(Transaction& t, const std::string& id) {
  return Guarded([&] { return Erase(TX(t).Mutable().isas, id); });
}

// ------------------------------------------------------------------
// Subscriptions
// ------------------------------------------------------------------

std::optional<model::Subscription> MemoryRepository::GetSubscription(Transaction& t, const std::string& id) {
  return Find(TX(t).Mutable().subscriptions, id);
}

std::vector<model::Subscription> MemoryRepository::SearchSubscriptions(Transaction& t, const model::SearchFilter& filter) {
  return Search(TX(t).Mutable().subscriptions, filter);
}

std::vector<model::Subscription> MemoryRepository::SearchSubscriptionsByOwner(Transaction& t, const model::CellSet& cells, const std::string& owner) {
  const auto                       query = model::NormalizeCells(cells);
  std::vector<model::Subscription> out;
  for (const auto& [_, sub] : TX(t).Mutable().subscriptions) {
    if (sub.owner == owner && model::CellsIntersect(sub.cells, query)) out.push_back(sub);
  }
  return out;
}

int64_t MemoryRepository::MaxSubscriptionCountInCellsByOwner(Transaction& t, const model::CellSet& cells, const std::string& owner) {
  const auto                                 query = model::NormalizeCells(cells);
  std::unordered_map<model::CellId, int64_t> per_cell;
  for (const auto& [_, sub] : TX(t).Mutable().subscriptions) {
    if (sub.owner != owner) continue;
    for (const auto cell : sub.cells) {
      if (std::binary_search(query.begin(), query.end(), cell)) ++per_cell[cell];
    }
  }

  int64_t max = 0;
  for (const auto& [_, n] : per_cell) max = std::max(max, n);
  return max;
}

Result MemoryRepository::UpsertSubscription(Transaction& t, model::Subscription& sub, std::optional<util::TimePoint> expected_updated_at) {
  return Guarded([&] {
    return Write(TX(t).Mutable().subscriptions, sub, expected_updated_at, [](model::Subscription& next, const model::Subscription* prev) {
      next.notification_index = prev ? prev->notification_index : 0;
    });
  });
}

Result MemoryRepository::DeleteSubscription(Transaction& t, const std::string& id) {
  return Guarded([&] { return Erase(TX(t).Mutable().subscriptions, id); });
}

Result MemoryRepository::IncrementNotificationIndices(Transaction& t, const model::SearchFilter& filter, std::vector<model::Subscription>& updated) {
  return Guarded([&] {
    std::vector<model::Subscription> out;
    for (auto& [_, sub] : TX(t).Mutable().subscriptions) {
      if (!model::CellsIntersect(sub.cells, filter.cells) || !MatchesWindow(sub, filter)) continue;
      ++sub.notification_index;
      out.push_back(sub);
    }
    updated = std::move(out);
    return Result::Ok();
  });
}

// ------------------------------------------------------------------
// Operational Intents
// ------------------------------------------------------------------

std::optional<model::OperationalIntent> MemoryRepository::GetOperationalIntent(Transaction& t, const std::string& id) {
  return Find(TX(t).Mutable().operational_intents, id);
}

model::CellSet MemoryRepository::ListOperationalIntentCells(Transaction& t, const std::string& id) {
  const auto& rows = TX(t).Mutable().operational_intents;
  auto        it   = rows.find(id);
  if (it == rows.end()) return {};
  return it->second.cells;
}

std::vector<model::OperationalIntent> MemoryRepository::SearchOperationalIntents(Transaction& t, const model::SearchFilter& filter) {
  return Search(TX(t).Mutable().operational_intents, filter);
}

Result MemoryRepository::UpsertOperationalIntent(Transaction& t, model::OperationalIntent& oi, std::optional<util::TimePoint> expected_updated_at) {
  return Guarded([&] {
    return Write(TX(t).Mutable().operational_intents, oi, expected_updated_at, [](model::OperationalIntent& next, const model::OperationalIntent* prev) {
      next.version = prev ? prev->version + 1 : 1;
    });
  });
}

Result MemoryRepository::DeleteOperationalIntent(Transaction& t, const std::string& id) {
  return Guarded([&] { return Erase(TX(t).Mutable().operational_intents, id); });
}

std::vector<std::string> MemoryRepository::GetDependentOperationalIntents(Transaction& t, const std::string& subscription_id) {
  std::vector<std::string> ids;
  for (const auto& [id, oi] : TX(t).Mutable().operational_intents) {
    if (oi.subscription_id && *oi.subscription_id == subscription_id) ids.push_back(id);
  }
  return ids;
}

} // namespace airspace::db::memory
