#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "internal/model/cells.hpp"

namespace airspace::db::sql {

/*
  Parameter abstraction.

  Postgres: $1 $2 $3
  SQLite:   ?1 ?2 ?3

  Both use ordered binding. Timestamps travel as int64 unix microseconds;
  the dialect wraps the placeholder where the column needs a conversion.
  Cell sets are bound in the backend's array format.
*/

using Param = std::variant<
    std::nullptr_t,
    int64_t,
    double,
    std::string,
    model::CellSet
>;

using Params = std::vector<Param>;

}
