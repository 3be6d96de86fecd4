#include "tables.hpp"

#include <algorithm>

namespace airspace::db::sql {

namespace {

bool IsBound(ColumnRole role) {
  switch (role) {
    case ColumnRole::kKey:
    case ColumnRole::kData:
    case ColumnRole::kTimestamp:
    case ColumnRole::kCells:
      return true;
    case ColumnRole::kServerTime:
    case ColumnRole::kSequence:
    case ColumnRole::kCounter:
      return false;
  }
  return false;
}

std::string BoundParam(const Dialect& dialect, const Column& column, int n) {
  switch (column.role) {
    case ColumnRole::kTimestamp:
      return dialect.TimestampParam(n);
    case ColumnRole::kCells:
      return dialect.CellsParam(n);
    default:
      return dialect.Placeholder(n);
  }
}

std::string Qualified(const TableDescriptor& table, std::string_view column) {
  return std::string(table.name) + "." + std::string(column);
}

} // namespace

bool HasAltitude(const TableDescriptor& table) {
  return std::any_of(table.columns.begin(), table.columns.end(), [](const Column& c) { return c.name == "altitude_upper"; });
}

std::size_t TableDescriptor::BoundColumnCount() const {
  return static_cast<std::size_t>(std::count_if(columns.begin(), columns.end(), [](const Column& c) { return IsBound(c.role); }));
}

std::string ProjectionList(const Dialect& dialect, const TableDescriptor& table) {
  std::string out;
  for (const auto& column : table.columns) {
    if (!out.empty()) out += ",";
    out += dialect.Projection(column);
  }
  return out;
}

std::string SelectById(const Dialect& dialect, const TableDescriptor& table) {
  return "SELECT " + ProjectionList(dialect, table) + " FROM " + std::string(table.name) + " WHERE id=" + dialect.Placeholder(1);
}

std::string UpsertStatement(const Dialect& dialect, const TableDescriptor& table) {
  std::string names;
  std::string values;
  std::string updates;
  int         n = 0;

  for (const auto& column : table.columns) {
    if (!names.empty()) {
      names += ",";
      values += ",";
    }
    names += column.name;

    std::string assignment;
    switch (column.role) {
      case ColumnRole::kKey:
        values += BoundParam(dialect, column, ++n);
        break;
      case ColumnRole::kData:
      case ColumnRole::kTimestamp:
      case ColumnRole::kCells:
        values += BoundParam(dialect, column, ++n);
        assignment = "excluded." + std::string(column.name);
        break;
      case ColumnRole::kServerTime:
        values += dialect.ServerNow();
        assignment = dialect.Greatest("excluded." + std::string(column.name), dialect.NextTick(Qualified(table, column.name)));
        break;
      case ColumnRole::kSequence:
        values += "1";
        assignment = Qualified(table, column.name) + "+1";
        break;
      case ColumnRole::kCounter:
        values += "0";
        break;
    }

    if (!assignment.empty()) {
      if (!updates.empty()) updates += ",";
      updates += std::string(column.name) + "=" + assignment;
    }
  }

  return "INSERT INTO " + std::string(table.name) + "(" + names + ") VALUES(" + values + ") ON CONFLICT(id) DO UPDATE SET " + updates +
         " RETURNING " + ProjectionList(dialect, table);
}

std::string ConditionalUpdateStatement(const Dialect& dialect, const TableDescriptor& table) {
  std::string updates;
  std::string key_param;
  int         n = 0;

  for (const auto& column : table.columns) {
    std::string assignment;
    switch (column.role) {
      case ColumnRole::kKey:
        key_param = BoundParam(dialect, column, ++n);
        continue;
      case ColumnRole::kData:
      case ColumnRole::kTimestamp:
      case ColumnRole::kCells:
        assignment = BoundParam(dialect, column, ++n);
        break;
      case ColumnRole::kServerTime:
        assignment = dialect.Greatest(dialect.ServerNow(), dialect.NextTick(column.name));
        break;
      case ColumnRole::kSequence:
        assignment = std::string(column.name) + "+1";
        break;
      case ColumnRole::kCounter:
        continue;
    }
    if (!updates.empty()) updates += ",";
    updates += std::string(column.name) + "=" + assignment;
  }

  return "UPDATE " + std::string(table.name) + " SET " + updates + " WHERE id=" + key_param + " AND updated_at=" +
         dialect.TimestampParam(n + 1) + " RETURNING " + ProjectionList(dialect, table);
}

std::string DeleteById(const Dialect& dialect, const TableDescriptor& table) {
  return "DELETE FROM " + std::string(table.name) + " WHERE id=" + dialect.Placeholder(1) + " RETURNING id";
}

std::string ExistsById(const Dialect& dialect, const TableDescriptor& table) {
  return "SELECT 1 FROM " + std::string(table.name) + " WHERE id=" + dialect.Placeholder(1);
}

std::string SearchStatement(const Dialect& dialect, const TableDescriptor& table) {
  std::string sql = "SELECT " + ProjectionList(dialect, table) + " FROM " + std::string(table.name) + " WHERE " + dialect.CellsOverlap(table, 1);

  int n = 1;
  if (HasAltitude(table)) {
    sql += " AND COALESCE(altitude_upper>=" + dialect.Placeholder(++n) + ",TRUE)";
    sql += " AND COALESCE(altitude_lower<=" + dialect.Placeholder(++n) + ",TRUE)";
  }
  sql += " AND COALESCE(ends_at>=" + dialect.TimestampParam(++n) + ",TRUE)";
  sql += " AND COALESCE(starts_at<=" + dialect.TimestampParam(++n) + ",TRUE)";
  sql += " ORDER BY id";
  return sql;
}

std::string SearchByOwnerStatement(const Dialect& dialect, const TableDescriptor& table) {
  return "SELECT " + ProjectionList(dialect, table) + " FROM " + std::string(table.name) + " WHERE " + dialect.CellsOverlap(table, 1) +
         " AND owner=" + dialect.Placeholder(2) + " ORDER BY id";
}

std::string IncrementNotificationIndexStatement(const Dialect& dialect) {
  return "UPDATE " + std::string(kSubscriptionTable.name) + " SET notification_index=notification_index+1 WHERE " +
         dialect.CellsOverlap(kSubscriptionTable, 1) + " AND COALESCE(ends_at>=" + dialect.TimestampParam(2) + ",TRUE)" +
         " AND COALESCE(starts_at<=" + dialect.TimestampParam(3) + ",TRUE)" + " RETURNING " + ProjectionList(dialect, kSubscriptionTable);
}

std::string SelectDependentIds(const Dialect& dialect) {
  return "SELECT id FROM " + std::string(kOperationalIntentTable.name) + " WHERE subscription_id=" + dialect.Placeholder(1) + " ORDER BY id";
}

} // namespace airspace::db::sql
