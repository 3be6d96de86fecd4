#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "internal/model/cells.hpp"
#include "internal/util/time.hpp"

namespace airspace::model {

enum class OperationalIntentState : std::uint8_t {
  kAccepted      = 1,
  kActivated     = 2,
  kNonconforming = 3,
  kContingent    = 4,
  kEnded         = 5,
};

std::string_view                      ToString(OperationalIntentState state);
std::optional<OperationalIntentState> ParseOperationalIntentState(std::string_view name);

struct OperationalIntent {
  std::string id;
  std::string manager;
  std::string url;

  // Sequence number assigned by the store: 1 on creation, +1 per mutation.
  int64_t version = 0;

  std::optional<double> altitude_lower;
  std::optional<double> altitude_upper;

  std::optional<util::TimePoint> starts_at;
  std::optional<util::TimePoint> ends_at;
  util::TimePoint                updated_at{};

  OperationalIntentState state = OperationalIntentState::kAccepted;

  // Weak reference; may dangle.
  std::optional<std::string> subscription_id;

  CellSet cells;

  // Derived from (updated_at, id), never stored.
  std::string ovn;
};

} // namespace airspace::model
