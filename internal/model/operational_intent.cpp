#include "operational_intent.hpp"

namespace airspace::model {

std::string_view ToString(OperationalIntentState state) {
  switch (state) {
    case OperationalIntentState::kAccepted:
      return "Accepted";
    case OperationalIntentState::kActivated:
      return "Activated";
    case OperationalIntentState::kNonconforming:
      return "Nonconforming";
    case OperationalIntentState::kContingent:
      return "Contingent";
    case OperationalIntentState::kEnded:
      return "Ended";
  }
  return "Unknown";
}

std::optional<OperationalIntentState> ParseOperationalIntentState(std::string_view name) {
  for (auto state : {OperationalIntentState::kAccepted, OperationalIntentState::kActivated, OperationalIntentState::kNonconforming,
                     OperationalIntentState::kContingent, OperationalIntentState::kEnded}) {
    if (ToString(state) == name) return state;
  }
  return std::nullopt;
}

} // namespace airspace::model
