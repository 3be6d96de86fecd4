#pragma once

#include <stdexcept>
#include <string>

namespace airspace::util {

/*
  Central error types.

  Every store operation reports failure through exactly one of these.
  The external API layer maps them onto its own status codes.
*/

class InvalidInput : public std::runtime_error {
 public:
  explicit InvalidInput(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Caller presented a stale or unmatched version token. Re-read and retry.
class VersionConflict : public std::runtime_error {
 public:
  explicit VersionConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

// An invariant of stored data does not hold (bootstrap defect or corruption).
class ConsistencyFault : public std::runtime_error {
 public:
  explicit ConsistencyFault(const std::string& msg) : std::runtime_error(msg) {
  }
};

class BackingStoreFault : public std::runtime_error {
 public:
  BackingStoreFault(const std::string& msg, std::string code) : std::runtime_error(msg), code_(std::move(code)) {
  }

  const std::string& code() const {
    return code_;
  }

 private:
  std::string code_;
};

class Cancelled : public std::runtime_error {
 public:
  explicit Cancelled(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace airspace::util
