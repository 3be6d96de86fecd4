#pragma once

#include "internal/db/sql/tables.hpp"

namespace airspace::db::postgres {

/*
  Postgres rendition of the shared statements.

  Timestamps: TIMESTAMPTZ, exchanged as int64 unix micros.
  Cells:      BIGINT[] with a GIN index; overlap is &&.
*/
class PgDialect final : public sql::Dialect {
 public:
  std::string Placeholder(int n) const override;
  std::string TimestampParam(int n) const override;
  std::string CellsParam(int n) const override;
  std::string Projection(const sql::Column& column) const override;
  std::string ServerNow() const override;
  std::string NextTick(std::string_view timestamp_expr) const override;
  std::string Greatest(std::string_view a, std::string_view b) const override;
  std::string CellsOverlap(const sql::TableDescriptor& table, int n) const override;
  std::string UnnestCells(const sql::TableDescriptor& table) const override;
  std::string MaxRowsPerCellByOwner(const sql::TableDescriptor& table) const override;
};

} // namespace airspace::db::postgres
