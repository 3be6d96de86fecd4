#include "sqlite_dialect.hpp"

namespace airspace::db::sqlite {

std::string SqliteDialect::Placeholder(int n) const {
  return "?" + std::to_string(n);
}

std::string SqliteDialect::TimestampParam(int n) const {
  return Placeholder(n);
}

std::string SqliteDialect::CellsParam(int n) const {
  return Placeholder(n);
}

std::string SqliteDialect::Projection(const sql::Column& column) const {
  return std::string(column.name);
}

std::string SqliteDialect::ServerNow() const {
  // julianday() carries millisecond precision; the NextTick rule keeps
  // updated_at strictly increasing within the same millisecond.
  return "CAST((julianday('now') - 2440587.5) * 86400000000.0 AS INTEGER)";
}

std::string SqliteDialect::NextTick(std::string_view timestamp_expr) const {
  return "(" + std::string(timestamp_expr) + "+1)";
}

std::string SqliteDialect::Greatest(std::string_view a, std::string_view b) const {
  return "MAX(" + std::string(a) + "," + std::string(b) + ")";
}

std::string SqliteDialect::CellsOverlap(const sql::TableDescriptor& table, int n) const {
  return "id IN (SELECT entity_id FROM " + std::string(table.cells_index_table) + " WHERE cell_id IN (SELECT value FROM json_each(" +
         Placeholder(n) + ")))";
}

std::string SqliteDialect::UnnestCells(const sql::TableDescriptor& table) const {
  const std::string name(table.name);
  return "SELECT json_each.value FROM " + name + ", json_each(" + name + ".cells) WHERE " + name + ".id=" + Placeholder(1);
}

std::string SqliteDialect::MaxRowsPerCellByOwner(const sql::TableDescriptor& table) const {
  const std::string name(table.name);
  const std::string cells(table.cells_index_table);
  return "SELECT COALESCE(MAX(n),0) FROM (SELECT COUNT(*) AS n FROM " + cells + " JOIN " + name + " ON " + name + ".id=" + cells +
         ".entity_id WHERE " + name + ".owner=" + Placeholder(2) + " AND " + cells + ".cell_id IN (SELECT value FROM json_each(" +
         Placeholder(1) + ")) GROUP BY " + cells + ".cell_id)";
}

} // namespace airspace::db::sqlite
