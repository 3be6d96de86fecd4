#pragma once

#include <optional>
#include <string>

#include "internal/model/cells.hpp"
#include "internal/util/time.hpp"

namespace airspace::model {

/*
  Identification Service Area row.

  updated_at is assigned by the backend on every write; callers leave it
  unset. version is derived from (updated_at, id) and never stored.
*/
struct IdentificationServiceArea {
  std::string id;
  std::string owner;
  std::string url;

  std::optional<util::TimePoint> starts_at;
  std::optional<util::TimePoint> ends_at;
  util::TimePoint                updated_at{};

  CellSet cells;

  std::string version;
};

} // namespace airspace::model
