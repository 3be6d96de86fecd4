#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/cells.hpp"
#include "internal/util/time.hpp"

namespace airspace::model {

struct Subscription {
  std::string id;
  std::string owner;
  std::string url;

  std::optional<util::TimePoint> starts_at;
  std::optional<util::TimePoint> ends_at;
  util::TimePoint                updated_at{};

  CellSet cells;

  // Bumped by notification bookkeeping only; an upsert keeps the stored value.
  int64_t notification_index = 0;

  std::string version;
};

} // namespace airspace::model
