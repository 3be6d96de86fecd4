#pragma once

#include <string_view>

#include "internal/db/api/result.hpp"

namespace airspace::store {

/*
  Backend codes -> util exception taxonomy.

    NotFound            -> util::NotFound
    Conflict            -> util::VersionConflict
    ConstraintViolation -> util::InvalidInput
    Corruption          -> util::ConsistencyFault (logged at error level)
    Cancelled           -> util::Cancelled
    everything else     -> util::BackingStoreFault, carrying the code name

  context names the operation and key, e.g. "upsert operational_intent <id>".
*/
[[noreturn]] void ThrowTranslated(std::string_view context, db::ErrorCode code, std::string_view message);

[[noreturn]] inline void ThrowTranslated(std::string_view context, const db::DbError& e) {
  ThrowTranslated(context, e.code(), e.what());
}

inline void ThrowIfError(std::string_view context, const db::Result& result) {
  if (!result) ThrowTranslated(context, result.code, result.message);
}

// Raises and logs util::ConsistencyFault.
[[noreturn]] void ThrowConsistencyFault(std::string_view context, std::string_view message);

} // namespace airspace::store
