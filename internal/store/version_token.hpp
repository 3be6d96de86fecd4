#pragma once

#include <string>
#include <string_view>

#include "internal/util/time.hpp"

namespace airspace::store {

/*
  Opaque fencing token (OVN).

  token = base64, unpadded, of SHA-256(id || RFC3339 micros of updated_at)

  The value is a pure function of the stored row, so two reads of an
  unmodified row agree and any write changes it.
*/
class VersionToken {
 public:
  static std::string Encode(util::TimePoint updated_at, std::string_view id);

  // Constant-time. Anything that is not the token of (updated_at, id),
  // including garbage and empty strings, is a mismatch.
  static bool Validate(std::string_view token, util::TimePoint updated_at, std::string_view id);
};

} // namespace airspace::store
