#pragma once

#include <optional>

#include "internal/model/cells.hpp"
#include "internal/util/time.hpp"

namespace airspace::model {

/*
  Spatio-temporal query.

  cells is required and must be non-empty. Absent bounds are unconstrained.
  Altitude bounds only apply to entity kinds that carry altitudes.
*/
struct SearchFilter {
  CellSet cells;

  std::optional<double> altitude_lower;
  std::optional<double> altitude_upper;

  std::optional<util::TimePoint> starts_at;
  std::optional<util::TimePoint> ends_at;
};

} // namespace airspace::model
