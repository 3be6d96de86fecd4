#pragma once

#include <string>
#include <string_view>

#include "internal/model/cells.hpp"

namespace airspace::db::sql {

/*
  Text forms of a cell set.

  FormatCellList(cells, '[', ']') -> "[1,2,3]"   (SQLite JSON array)
  FormatCellList(cells, '{', '}') -> "{1,2,3}"   (Postgres array literal)

  ParseCellList accepts either bracket style, or none ("1,2,3"), and returns
  a normalized set. Throws std::invalid_argument on anything else.
*/

std::string FormatCellList(const model::CellSet& cells, char open, char close);

model::CellSet ParseCellList(std::string_view text);

} // namespace airspace::db::sql
