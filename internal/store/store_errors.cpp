#include "store_errors.hpp"

#include <string>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace airspace::store {

void ThrowConsistencyFault(std::string_view context, std::string_view message) {
  AIRSPACE_LOG_ERROR("consistency fault", {observability::StringField("context", context), observability::StringField("error", message)});
  throw util::ConsistencyFault(std::string(context) + ": " + std::string(message));
}

void ThrowTranslated(std::string_view context, db::ErrorCode code, std::string_view message) {
  const std::string what = std::string(context) + ": " + std::string(message);
  switch (code) {
    case db::ErrorCode::NotFound:
      throw util::NotFound(what);
    case db::ErrorCode::Conflict:
      throw util::VersionConflict(what);
    case db::ErrorCode::ConstraintViolation:
      throw util::InvalidInput(what);
    case db::ErrorCode::Corruption:
      ThrowConsistencyFault(context, message);
    case db::ErrorCode::Cancelled:
      throw util::Cancelled(what);
    case db::ErrorCode::OK:
      throw util::BackingStoreFault(what + " (error reported with OK code)", std::string(db::ErrorCodeName(code)));
    case db::ErrorCode::Busy:
    case db::ErrorCode::SerializationFailure:
    case db::ErrorCode::IOError:
    case db::ErrorCode::InternalError:
      break;
  }
  throw util::BackingStoreFault(what, std::string(db::ErrorCodeName(code)));
}

} // namespace airspace::store
