#pragma once

#include <array>
#include <span>
#include <string>
#include <string_view>

namespace airspace::db::sql {

/*
  Named column descriptors.

  One descriptor per table lists every persisted column once, in the order
  used by BOTH the read projection and the write statements. Column
  positions are exposed as enums so row decoding and parameter encoding
  refer to the same names.
*/

enum class ColumnRole {
  kKey,             // id; bound on insert, matched on update
  kData,            // bound on insert, overwritten on update
  kTimestamp,       // like kData, int64 unix micros converted by the dialect
  kCells,           // like kData, cell set in the backend's array format
  kServerTime,      // updated_at: backend clock, strictly increasing per row
  kSequence,        // 1 on insert, previous + 1 on every update
  kCounter,         // 0 on insert, untouched by upserts
};

struct Column {
  std::string_view name;
  ColumnRole       role;
};

struct TableDescriptor {
  std::string_view        name;
  std::string_view        cells_index_table;  // SQLite mirror of the cell set
  std::span<const Column> columns;

  // Columns the caller supplies a parameter for, in descriptor order.
  std::size_t BoundColumnCount() const;
};

// ---------------------------------------------------------------------------
// identification_service_areas
// ---------------------------------------------------------------------------

enum IsaColumn : int { kIsaId, kIsaOwner, kIsaUrl, kIsaStartsAt, kIsaEndsAt, kIsaUpdatedAt, kIsaCells, kIsaColumnCount };

inline constexpr std::array<Column, kIsaColumnCount> kIsaColumns = {{
    {"id", ColumnRole::kKey},
    {"owner", ColumnRole::kData},
    {"url", ColumnRole::kData},
    {"starts_at", ColumnRole::kTimestamp},
    {"ends_at", ColumnRole::kTimestamp},
    {"updated_at", ColumnRole::kServerTime},
    {"cells", ColumnRole::kCells},
}};

inline constexpr TableDescriptor kIsaTable{"identification_service_areas", "identification_service_area_cells", kIsaColumns};

// ---------------------------------------------------------------------------
// subscriptions
// ---------------------------------------------------------------------------

enum SubscriptionColumn : int {
  kSubId,
  kSubOwner,
  kSubUrl,
  kSubNotificationIndex,
  kSubStartsAt,
  kSubEndsAt,
  kSubUpdatedAt,
  kSubCells,
  kSubColumnCount
};

inline constexpr std::array<Column, kSubColumnCount> kSubscriptionColumns = {{
    {"id", ColumnRole::kKey},
    {"owner", ColumnRole::kData},
    {"url", ColumnRole::kData},
    {"notification_index", ColumnRole::kCounter},
    {"starts_at", ColumnRole::kTimestamp},
    {"ends_at", ColumnRole::kTimestamp},
    {"updated_at", ColumnRole::kServerTime},
    {"cells", ColumnRole::kCells},
}};

inline constexpr TableDescriptor kSubscriptionTable{"subscriptions", "subscription_cells", kSubscriptionColumns};

// ---------------------------------------------------------------------------
// operational_intents
// ---------------------------------------------------------------------------

enum OperationalIntentColumn : int {
  kOiId,
  kOiOwner,
  kOiVersion,
  kOiUrl,
  kOiAltitudeLower,
  kOiAltitudeUpper,
  kOiStartsAt,
  kOiEndsAt,
  kOiSubscriptionId,
  kOiUpdatedAt,
  kOiState,
  kOiCells,
  kOiColumnCount
};

inline constexpr std::array<Column, kOiColumnCount> kOperationalIntentColumns = {{
    {"id", ColumnRole::kKey},
    {"owner", ColumnRole::kData},
    {"version", ColumnRole::kSequence},
    {"url", ColumnRole::kData},
    {"altitude_lower", ColumnRole::kData},
    {"altitude_upper", ColumnRole::kData},
    {"starts_at", ColumnRole::kTimestamp},
    {"ends_at", ColumnRole::kTimestamp},
    {"subscription_id", ColumnRole::kData},
    {"updated_at", ColumnRole::kServerTime},
    {"state", ColumnRole::kData},
    {"cells", ColumnRole::kCells},
}};

inline constexpr TableDescriptor kOperationalIntentTable{"operational_intents", "operational_intent_cells", kOperationalIntentColumns};

// ---------------------------------------------------------------------------
// Dialect
// ---------------------------------------------------------------------------

/*
  Backend-specific SQL fragments. Placeholder numbers are 1-based.
*/
class Dialect {
 public:
  virtual ~Dialect() = default;

  virtual std::string Placeholder(int n) const = 0;

  // Placeholder holding int64 unix micros, as a value of the timestamp column type.
  virtual std::string TimestampParam(int n) const = 0;

  virtual std::string CellsParam(int n) const = 0;

  // Read expression for a column, yielding what Row expects
  // (int64 micros for timestamps, delimited list for cells).
  virtual std::string Projection(const Column& column) const = 0;

  // Current backend time as a value of the timestamp column type.
  virtual std::string ServerNow() const = 0;

  // Smallest timestamp strictly after the given expression.
  virtual std::string NextTick(std::string_view timestamp_expr) const = 0;

  virtual std::string Greatest(std::string_view a, std::string_view b) const = 0;

  // Predicate: the table's cell set shares at least one cell with param n.
  virtual std::string CellsOverlap(const TableDescriptor& table, int n) const = 0;

  // SELECT returning one row per cell of the row with id = param 1.
  virtual std::string UnnestCells(const TableDescriptor& table) const = 0;

  // SELECT returning, for the given owner (param 2), the largest number of
  // that owner's rows sharing any single cell of param 1.
  virtual std::string MaxRowsPerCellByOwner(const TableDescriptor& table) const = 0;
};

// ---------------------------------------------------------------------------
// Statement builders
// ---------------------------------------------------------------------------

// "<projection>, <projection>, ..." in descriptor order.
std::string ProjectionList(const Dialect& dialect, const TableDescriptor& table);

// SELECT <projection> FROM <table> WHERE id = <param 1>
std::string SelectById(const Dialect& dialect, const TableDescriptor& table);

// Insert-or-replace. Parameters: the bound columns, in descriptor order.
std::string UpsertStatement(const Dialect& dialect, const TableDescriptor& table);

// Update guarded by the stored updated_at. Parameters: the bound columns in
// descriptor order, then the expected updated_at.
std::string ConditionalUpdateStatement(const Dialect& dialect, const TableDescriptor& table);

// Returns the deleted id, so callers can tell a no-op delete from a real one.
std::string DeleteById(const Dialect& dialect, const TableDescriptor& table);

std::string ExistsById(const Dialect& dialect, const TableDescriptor& table);

bool HasAltitude(const TableDescriptor& table);

/*
  Search predicate of the matching rule. Parameters:
    with altitude columns:    1 cells, 2 altitude lower, 3 altitude upper,
                              4 window start, 5 window end
    without altitude columns: 1 cells, 2 window start, 3 window end
*/
std::string SearchStatement(const Dialect& dialect, const TableDescriptor& table);

std::string SearchByOwnerStatement(const Dialect& dialect, const TableDescriptor& table);

// Parameters: 1 cells, 2 window start, 3 window end.
std::string IncrementNotificationIndexStatement(const Dialect& dialect);

std::string SelectDependentIds(const Dialect& dialect);

} // namespace airspace::db::sql
