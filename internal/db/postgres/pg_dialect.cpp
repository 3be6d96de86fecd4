#include "pg_dialect.hpp"

namespace airspace::db::postgres {

std::string PgDialect::Placeholder(int n) const {
  return "$" + std::to_string(n);
}

std::string PgDialect::TimestampParam(int n) const {
  return "(TIMESTAMPTZ 'epoch' + " + Placeholder(n) + "::BIGINT * INTERVAL '1 microsecond')";
}

std::string PgDialect::CellsParam(int n) const {
  return Placeholder(n) + "::BIGINT[]";
}

std::string PgDialect::Projection(const sql::Column& column) const {
  const std::string name(column.name);
  switch (column.role) {
    case sql::ColumnRole::kTimestamp:
    case sql::ColumnRole::kServerTime:
      return "ROUND(EXTRACT(EPOCH FROM " + name + ")*1000000)::BIGINT";
    case sql::ColumnRole::kCells:
      return "array_to_string(" + name + ",',')";
    default:
      return name;
  }
}

std::string PgDialect::ServerNow() const {
  return "clock_timestamp()";
}

std::string PgDialect::NextTick(std::string_view timestamp_expr) const {
  return "(" + std::string(timestamp_expr) + " + INTERVAL '1 microsecond')";
}

std::string PgDialect::Greatest(std::string_view a, std::string_view b) const {
  return "GREATEST(" + std::string(a) + "," + std::string(b) + ")";
}

std::string PgDialect::CellsOverlap(const sql::TableDescriptor&, int n) const {
  return "cells && " + CellsParam(n);
}

std::string PgDialect::UnnestCells(const sql::TableDescriptor& table) const {
  return "SELECT unnest(cells) FROM " + std::string(table.name) + " WHERE id=" + Placeholder(1);
}

std::string PgDialect::MaxRowsPerCellByOwner(const sql::TableDescriptor& table) const {
  return "SELECT COALESCE(MAX(n),0)::BIGINT FROM (SELECT COUNT(*) AS n FROM " + std::string(table.name) +
         ", unnest(cells) AS cell WHERE owner=" + Placeholder(2) + " AND cell = ANY(" + CellsParam(1) + ") GROUP BY cell) AS per_cell";
}

} // namespace airspace::db::postgres
