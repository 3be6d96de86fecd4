#include "sql_repository.hpp"

#include <stdexcept>

namespace airspace::db::sql {

namespace {

Param TimestampOrNull(const std::optional<util::TimePoint>& tp) {
  if (!tp) return nullptr;
  return util::ToUnixMicros(*tp);
}

Param DoubleOrNull(const std::optional<double>& v) {
  if (!v) return nullptr;
  return *v;
}

std::optional<util::TimePoint> OptionalTimestamp(const Row& row, int col) {
  if (row.IsNull(col)) return std::nullopt;
  return util::FromUnixMicros(row.GetInt64(col));
}

std::optional<double> OptionalDouble(const Row& row, int col) {
  if (row.IsNull(col)) return std::nullopt;
  return row.GetDouble(col);
}

// A row that cannot be decoded violates the schema's own checks.
template <typename Fn>
auto Decoded(Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const std::invalid_argument& e) {
    throw DbError(ErrorCode::Corruption, std::string("undecodable row: ") + e.what());
  }
}

// ---------------------------------------------------------------------------
// Encoding: bound columns in descriptor order
// ---------------------------------------------------------------------------

Params Encode(const model::IdentificationServiceArea& isa) {
  return {isa.id, isa.owner, isa.url, TimestampOrNull(isa.starts_at), TimestampOrNull(isa.ends_at), isa.cells};
}

Params Encode(const model::Subscription& sub) {
  return {sub.id, sub.owner, sub.url, TimestampOrNull(sub.starts_at), TimestampOrNull(sub.ends_at), sub.cells};
}

Params Encode(const model::OperationalIntent& oi) {
  Param subscription_id = nullptr;
  if (oi.subscription_id) subscription_id = *oi.subscription_id;

  return {oi.id,
          oi.manager,
          oi.url,
          DoubleOrNull(oi.altitude_lower),
          DoubleOrNull(oi.altitude_upper),
          TimestampOrNull(oi.starts_at),
          TimestampOrNull(oi.ends_at),
          std::move(subscription_id),
          std::string(model::ToString(oi.state)),
          oi.cells};
}

// ---------------------------------------------------------------------------
// Decoding: full projection in descriptor order
// ---------------------------------------------------------------------------

model::IdentificationServiceArea DecodeIsa(const Row& row) {
  return Decoded([&] {
    model::IdentificationServiceArea isa;
    isa.id         = row.GetText(kIsaId);
    isa.owner      = row.GetText(kIsaOwner);
    isa.url        = row.GetText(kIsaUrl);
    isa.starts_at  = OptionalTimestamp(row, kIsaStartsAt);
    isa.ends_at    = OptionalTimestamp(row, kIsaEndsAt);
    isa.updated_at = util::FromUnixMicros(row.GetInt64(kIsaUpdatedAt));
    isa.cells      = row.GetCells(kIsaCells);
    return isa;
  });
}

model::Subscription DecodeSubscription(const Row& row) {
  return Decoded([&] {
    model::Subscription sub;
    sub.id                 = row.GetText(kSubId);
    sub.owner              = row.GetText(kSubOwner);
    sub.url                = row.GetText(kSubUrl);
    sub.notification_index = row.GetInt64(kSubNotificationIndex);
    sub.starts_at          = OptionalTimestamp(row, kSubStartsAt);
    sub.ends_at            = OptionalTimestamp(row, kSubEndsAt);
    sub.updated_at         = util::FromUnixMicros(row.GetInt64(kSubUpdatedAt));
    sub.cells              = row.GetCells(kSubCells);
    return sub;
  });
}

model::OperationalIntent DecodeOperationalIntent(const Row& row) {
  return Decoded([&] {
    model::OperationalIntent oi;
    oi.id             = row.GetText(kOiId);
    oi.manager        = row.GetText(kOiOwner);
    oi.version        = row.GetInt64(kOiVersion);
    oi.url            = row.GetText(kOiUrl);
    oi.altitude_lower = OptionalDouble(row, kOiAltitudeLower);
    oi.altitude_upper = OptionalDouble(row, kOiAltitudeUpper);
    oi.starts_at      = OptionalTimestamp(row, kOiStartsAt);
    oi.ends_at        = OptionalTimestamp(row, kOiEndsAt);
    if (!row.IsNull(kOiSubscriptionId)) oi.subscription_id = row.GetText(kOiSubscriptionId);
    oi.updated_at = util::FromUnixMicros(row.GetInt64(kOiUpdatedAt));

    const auto state_name = row.GetText(kOiState);
    const auto state      = model::ParseOperationalIntentState(state_name);
    if (!state) throw std::invalid_argument("unknown operational intent state '" + state_name + "'");
    oi.state = *state;

    oi.cells = row.GetCells(kOiCells);
    return oi;
  });
}

Params SearchParams(const model::SearchFilter& filter, bool with_altitude) {
  Params params{filter.cells};
  if (with_altitude) {
    params.push_back(DoubleOrNull(filter.altitude_lower));
    params.push_back(DoubleOrNull(filter.altitude_upper));
  }
  params.push_back(TimestampOrNull(filter.starts_at));
  params.push_back(TimestampOrNull(filter.ends_at));
  return params;
}

Result ToResult(const DbError& e) {
  return Result::Err(e.code(), e.what());
}

} // namespace

SqlRepository::SqlRepository(std::unique_ptr<Dialect> dialect)
    : dialect_(std::move(dialect)),
      isa_(BuildStatements(*dialect_, kIsaTable)),
      subscription_(BuildStatements(*dialect_, kSubscriptionTable)),
      operational_intent_(BuildStatements(*dialect_, kOperationalIntentTable)),
      unnest_operational_intent_cells_(dialect_->UnnestCells(kOperationalIntentTable)),
      max_subscriptions_per_cell_(dialect_->MaxRowsPerCellByOwner(kSubscriptionTable)),
      increment_notification_index_(IncrementNotificationIndexStatement(*dialect_)),
      select_dependent_ids_(SelectDependentIds(*dialect_)) {
}

SqlRepository::TableStatements SqlRepository::BuildStatements(const Dialect& dialect, const TableDescriptor& table) {
  return TableStatements{
      .select_by_id       = SelectById(dialect, table),
      .upsert             = UpsertStatement(dialect, table),
      .conditional_update = ConditionalUpdateStatement(dialect, table),
      .delete_by_id       = DeleteById(dialect, table),
      .exists_by_id       = ExistsById(dialect, table),
      .search             = SearchStatement(dialect, table),
      .search_by_owner    = SearchByOwnerStatement(dialect, table),
  };
}

bool SqlRepository::Exists(Transaction& tx, const TableStatements& statements, const std::string& id) {
  bool found = false;
  Query(tx, statements.exists_by_id, {id}, [&](const Row&) { found = true; });
  return found;
}

Result SqlRepository::Delete(Transaction& tx, const TableStatements& statements, const std::string& id) {
  try {
    int deleted = 0;
    Query(tx, statements.delete_by_id, {id}, [&](const Row&) { ++deleted; });
    if (deleted == 0) return Result::Err(ErrorCode::NotFound, "no row with id " + id);
    return Result::Ok();
  } catch (const DbError& e) {
    return ToResult(e);
  }
}

template <typename Record, typename Decode>
Result SqlRepository::Write(Transaction& tx,
                            const TableStatements& statements,
                            Params params,
                            std::optional<util::TimePoint> expected_updated_at,
                            Record& record,
                            Decode decode) {
  try {
    std::optional<Record> written;
    auto                  visit = [&](const Row& row) {
      if (written) throw DbError(ErrorCode::Corruption, "write of " + record.id + " returned more than one row");
      written = decode(row);
    };

    if (expected_updated_at) {
      params.push_back(util::ToUnixMicros(*expected_updated_at));
      Query(tx, statements.conditional_update, params, visit);
      if (!written) {
        if (Exists(tx, statements, record.id)) {
          return Result::Err(ErrorCode::Conflict, "row " + record.id + " was modified concurrently");
        }
        return Result::Err(ErrorCode::NotFound, "no row with id " + record.id);
      }
    } else {
      Query(tx, statements.upsert, params, visit);
      if (!written) return Result::Err(ErrorCode::InternalError, "upsert of " + record.id + " returned no row");
    }

    record = std::move(*written);
    return Result::Ok();
  } catch (const DbError& e) {
    return ToResult(e);
  }
}

// ---------------------------------------------------------------------------
// Identification Service Areas
// ---------------------------------------------------------------------------

std::optional<model::IdentificationServiceArea> SqlRepository::GetIsa(Transaction& tx, const std::string& id) {
  std::optional<model::IdentificationServiceArea> out;
  int                                             rows = 0;
  Query(tx, isa_.select_by_id, {id}, [&](const Row& row) {
    ++rows;
    out = DecodeIsa(row);
  });
  if (rows > 1) throw DbError(ErrorCode::Corruption, "multiple rows for identification service area " + id);
  return out;
}

std::vector<model::IdentificationServiceArea> SqlRepository::SearchIsas(Transaction& tx, const model::SearchFilter& filter) {
  std::vector<model::IdentificationServiceArea> out;
  Query(tx, isa_.search, SearchParams(filter, HasAltitude(kIsaTable)), [&](const Row& row) { out.push_back(DecodeIsa(row)); });
  return out;
}

Result SqlRepository::UpsertIsa(Transaction& tx, model::IdentificationServiceArea& isa, std::optional<util::TimePoint> expected_updated_at) {
  return Write(tx, isa_, Encode(isa), expected_updated_at, isa, DecodeIsa);
}

Result SqlRepository::DeleteIsa(Transaction& tx, const std::string& id) {
  return Delete(tx, isa_, id);
}

// ---------------------------------------------------------------------------
// Subscriptions
// ---------------------------------------------------------------------------

std::optional<model::Subscription> SqlRepository::GetSubscription(Transaction& tx, const std::string& id) {
  std::optional<model::Subscription> out;
  int                                rows = 0;
  Query(tx, subscription_.select_by_id, {id}, [&](const Row& row) {
    ++rows;
    out = DecodeSubscription(row);
  });
  if (rows > 1) throw DbError(ErrorCode::Corruption, "multiple rows for subscription " + id);
  return out;
}

std::vector<model::Subscription> SqlRepository::SearchSubscriptions(Transaction& tx, const model::SearchFilter& filter) {
  std::vector<model::Subscription> out;
  Query(tx, subscription_.search, SearchParams(filter, HasAltitude(kSubscriptionTable)), [&](const Row& row) {
    out.push_back(DecodeSubscription(row));
  });
  return out;
}

std::vector<model::Subscription> SqlRepository::SearchSubscriptionsByOwner(Transaction& tx, const model::CellSet& cells, const std::string& owner) {
  std::vector<model::Subscription> out;
  Query(tx, subscription_.search_by_owner, {cells, owner}, [&](const Row& row) { out.push_back(DecodeSubscription(row)); });
  return out;
}

int64_t SqlRepository::MaxSubscriptionCountInCellsByOwner(Transaction& tx, const model::CellSet& cells, const std::string& owner) {
  int64_t count = 0;
  Query(tx, max_subscriptions_per_cell_, {cells, owner}, [&](const Row& row) {
    if (!row.IsNull(0)) count = row.GetInt64(0);
  });
  return count;
}

Result SqlRepository::UpsertSubscription(Transaction& tx, model::Subscription& sub, std::optional<util::TimePoint> expected_updated_at) {
  return Write(tx, subscription_, Encode(sub), expected_updated_at, sub, DecodeSubscription);
}

Result SqlRepository::DeleteSubscription(Transaction& tx, const std::string& id) {
  return Delete(tx, subscription_, id);
}

Result SqlRepository::IncrementNotificationIndices(Transaction& tx, const model::SearchFilter& filter, std::vector<model::Subscription>& updated) {
  try {
    std::vector<model::Subscription> out;
    Query(tx, increment_notification_index_, SearchParams(filter, false), [&](const Row& row) { out.push_back(DecodeSubscription(row)); });
    updated = std::move(out);
    return Result::Ok();
  } catch (const DbError& e) {
    return ToResult(e);
  }
}

// ---------------------------------------------------------------------------
// Operational Intents
// ---------------------------------------------------------------------------

std::optional<model::OperationalIntent> SqlRepository::GetOperationalIntent(Transaction& tx, const std::string& id) {
  std::optional<model::OperationalIntent> out;
  int                                     rows = 0;
  Query(tx, operational_intent_.select_by_id, {id}, [&](const Row& row) {
    ++rows;
    out = DecodeOperationalIntent(row);
  });
  if (rows > 1) throw DbError(ErrorCode::Corruption, "multiple rows for operational intent " + id);
  return out;
}

model::CellSet SqlRepository::ListOperationalIntentCells(Transaction& tx, const std::string& id) {
  model::CellSet cells;
  Query(tx, unnest_operational_intent_cells_, {id}, [&](const Row& row) { cells.push_back(row.GetInt64(0)); });
  return model::NormalizeCells(std::move(cells));
}

std::vector<model::OperationalIntent> SqlRepository::SearchOperationalIntents(Transaction& tx, const model::SearchFilter& filter) {
  std::vector<model::OperationalIntent> out;
  Query(tx, operational_intent_.search, SearchParams(filter, HasAltitude(kOperationalIntentTable)), [&](const Row& row) {
    out.push_back(DecodeOperationalIntent(row));
  });
  return out;
}

Result SqlRepository::UpsertOperationalIntent(Transaction& tx, model::OperationalIntent& oi, std::optional<util::TimePoint> expected_updated_at) {
  return Write(tx, operational_intent_, Encode(oi), expected_updated_at, oi, DecodeOperationalIntent);
}

Result SqlRepository::DeleteOperationalIntent(Transaction& tx, const std::string& id) {
  return Delete(tx, operational_intent_, id);
}

std::vector<std::string> SqlRepository::GetDependentOperationalIntents(Transaction& tx, const std::string& subscription_id) {
  std::vector<std::string> ids;
  Query(tx, select_dependent_ids_, {subscription_id}, [&](const Row& row) { ids.push_back(row.GetText(0)); });
  return ids;
}

} // namespace airspace::db::sql
