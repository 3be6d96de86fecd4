#include "entity_repository.hpp"

#include "internal/observability/logging.hpp"
#include "internal/store/version_token.hpp"

namespace airspace::store {

namespace {

// Read paths of db::Repository throw DbError; give it the operation's context.
template <typename Fn>
auto Translated(std::string_view context, Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const db::DbError& e) {
    ThrowTranslated(context, e);
  }
}

} // namespace

template <typename Record>
EntityRepository<Record>::EntityRepository(std::shared_ptr<db::Repository> db) : db_(std::move(db)) {
}

template <typename Record>
std::string EntityRepository<Record>::Context(std::string_view op, std::string_view id) const {
  std::string out(op);
  out += " ";
  out += Traits::kName;
  if (!id.empty()) {
    out += " ";
    out += id;
  }
  return out;
}

template <typename Record>
void EntityRepository<Record>::Validate(const Record& entity) const {
  const auto ctx = Context("upsert", entity.id);

  if (entity.id.empty()) throw util::InvalidInput(ctx + ": id must not be empty");
  if (entity.cells.empty()) throw util::InvalidInput(ctx + ": cells must not be empty");
  if (entity.starts_at && entity.ends_at && !(*entity.starts_at < *entity.ends_at)) {
    throw util::InvalidInput(ctx + ": starts_at must be before ends_at");
  }
  if constexpr (Traits::HasAltitude) {
    if (entity.altitude_lower && entity.altitude_upper && *entity.altitude_lower > *entity.altitude_upper) {
      throw util::InvalidInput(ctx + ": altitude_lower must not exceed altitude_upper");
    }
  }
}

template <typename Record>
void EntityRepository<Record>::CheckCommittedCells(std::string_view op, Record& row, db::Transaction& tx) {
  const auto ctx = Context(op, row.id);
  if (row.cells.empty()) ThrowConsistencyFault(ctx, "committed row has an empty cell set");

  if constexpr (std::is_same_v<Record, model::OperationalIntent>) {
    auto unnested = Translated(ctx, [&] { return db_->ListOperationalIntentCells(tx, row.id); });
    if (unnested.empty()) ThrowConsistencyFault(ctx, "unnested cell set is empty");
    if (unnested != row.cells) ThrowConsistencyFault(ctx, "row cells and unnested cells disagree");
    row.cells = std::move(unnested);
  }
}

template <typename Record>
Record EntityRepository<Record>::Get(Scope& scope, const std::string& id) {
  const auto ctx = Context("get", id);
  scope.ThrowIfCancelled(ctx);

  auto row = Translated(ctx, [&] { return Traits::Get(*db_, scope.tx(), id); });
  if (!row) throw util::NotFound(ctx + ": not found");

  CheckCommittedCells("get", *row, scope.tx());
  Traits::Token(*row) = VersionToken::Encode(row->updated_at, row->id);
  return std::move(*row);
}

template <typename Record>
std::vector<Record> EntityRepository<Record>::Search(Scope& scope, model::SearchFilter filter) {
  const auto ctx = Context("search", "");
  if (filter.cells.empty()) throw util::InvalidInput(ctx + ": filter cells must not be empty");
  scope.ThrowIfCancelled(ctx);

  filter.cells = model::NormalizeCells(std::move(filter.cells));
  if constexpr (!Traits::HasAltitude) {
    filter.altitude_lower.reset();
    filter.altitude_upper.reset();
  }

  auto rows = Translated(ctx, [&] { return Traits::Search(*db_, scope.tx(), filter); });
  for (auto& row : rows) {
    if (row.cells.empty()) ThrowConsistencyFault(Context("search", row.id), "committed row has an empty cell set");
    Traits::Token(row) = VersionToken::Encode(row.updated_at, row.id);
  }
  return rows;
}

template <typename Record>
Record EntityRepository<Record>::Upsert(Scope& scope, Record entity, const std::optional<std::string>& expected_token) {
  Validate(entity);

  const auto ctx = Context("upsert", entity.id);
  scope.ThrowIfCancelled(ctx);

  entity.cells           = model::NormalizeCells(std::move(entity.cells));
  const auto input_cells = entity.cells;

  auto current = Translated(ctx, [&] { return Traits::Get(*db_, scope.tx(), entity.id); });

  std::optional<util::TimePoint> expected_updated_at;
  if (expected_token) {
    if (!current) throw util::VersionConflict(ctx + ": version token presented for a row that does not exist");
    if (!VersionToken::Validate(*expected_token, current->updated_at, current->id)) {
      throw util::VersionConflict(ctx + ": version token does not match the current row");
    }
    if (Traits::Owner(*current) != Traits::Owner(entity)) {
      throw util::InvalidInput(ctx + ": owner " + Traits::Owner(*current) + " cannot be changed to " + Traits::Owner(entity));
    }
    expected_updated_at = current->updated_at;
  } else if (current) {
    observability::LogWarn("upsert without version token replaced an existing row",
                           {observability::StringField("kind", Traits::kName), observability::StringField("id", entity.id)});
  }

  const db::Result result = Traits::Upsert(*db_, scope.tx(), entity, expected_updated_at);
  if (!result) {
    // The row vanished between the check and the guarded write.
    if (expected_updated_at && result.code == db::ErrorCode::NotFound) {
      throw util::VersionConflict(ctx + ": " + result.message);
    }
    ThrowIfError(ctx, result);
  }

  entity.cells           = input_cells;
  Traits::Token(entity) = VersionToken::Encode(entity.updated_at, entity.id);
  return entity;
}

template <typename Record>
void EntityRepository<Record>::Delete(Scope& scope, const std::string& id) {
  const auto ctx = Context("delete", id);
  scope.ThrowIfCancelled(ctx);
  ThrowIfError(ctx, Traits::Delete(*db_, scope.tx(), id));
}

template class EntityRepository<model::IdentificationServiceArea>;
template class EntityRepository<model::Subscription>;
template class EntityRepository<model::OperationalIntent>;

// ---------------------------------------------------------------------------
// Subscriptions
// ---------------------------------------------------------------------------

std::vector<model::Subscription> SubscriptionRepository::SearchByOwner(Scope& scope, const model::CellSet& cells, const std::string& owner) {
  const auto ctx = Context("search_by_owner", owner);
  if (cells.empty()) throw util::InvalidInput(ctx + ": cells must not be empty");
  scope.ThrowIfCancelled(ctx);

  const auto query = model::NormalizeCells(cells);
  auto       rows  = Translated(ctx, [&] { return db().SearchSubscriptionsByOwner(scope.tx(), query, owner); });
  for (auto& row : rows) row.version = VersionToken::Encode(row.updated_at, row.id);
  return rows;
}

int64_t SubscriptionRepository::MaxCountInCellsByOwner(Scope& scope, const model::CellSet& cells, const std::string& owner) {
  const auto ctx = Context("max_count_in_cells", owner);
  if (cells.empty()) throw util::InvalidInput(ctx + ": cells must not be empty");
  scope.ThrowIfCancelled(ctx);

  const auto query = model::NormalizeCells(cells);
  return Translated(ctx, [&] { return db().MaxSubscriptionCountInCellsByOwner(scope.tx(), query, owner); });
}

} // namespace airspace::store
