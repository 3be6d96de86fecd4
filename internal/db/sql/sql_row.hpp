#pragma once

#include <cstdint>
#include <string>

#include "internal/db/sql/cell_codec.hpp"

namespace airspace::db::sql {

/*
  Generic row reader.

  Backends wrap their result row:
    postgres -> pqxx::row
    sqlite   -> sqlite3_stmt

  Prevents driver types leaking into repository logic.
*/

class Row {
public:
  virtual ~Row() = default;

  virtual std::string GetText(int col) const = 0;
  virtual int64_t GetInt64(int col) const = 0;
  virtual double GetDouble(int col) const = 0;
  virtual bool IsNull(int col) const = 0;

  // Projections render cell sets as a delimited integer list.
  model::CellSet GetCells(int col) const {
    return ParseCellList(GetText(col));
  }
};

}
