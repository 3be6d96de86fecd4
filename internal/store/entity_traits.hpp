#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace airspace::store {

/*
  Per-kind bindings onto db::Repository.

  Each specialization provides:
    kName                    name used in error contexts and logs
    Get / Search / Upsert / Delete
    Token(record)            the derived version field
    Owner(record)            the owning USS, fixed once the row exists
    HasAltitude              whether altitude bounds apply
*/
template <typename Record>
struct EntityTraits;

template <>
struct EntityTraits<model::IdentificationServiceArea> {
  using Record = model::IdentificationServiceArea;

  static constexpr std::string_view kName       = "identification_service_area";
  static constexpr bool             HasAltitude = false;

  static std::optional<Record> Get(db::Repository& repo, db::Transaction& tx, const std::string& id) {
    return repo.GetIsa(tx, id);
  }
  static std::vector<Record> Search(db::Repository& repo, db::Transaction& tx, const model::SearchFilter& filter) {
    return repo.SearchIsas(tx, filter);
  }
  static db::Result Upsert(db::Repository& repo, db::Transaction& tx, Record& r, std::optional<util::TimePoint> expected) {
    return repo.UpsertIsa(tx, r, expected);
  }
  static db::Result Delete(db::Repository& repo, db::Transaction& tx, const std::string& id) {
    return repo.DeleteIsa(tx, id);
  }
  static std::string& Token(Record& r) {
    return r.version;
  }
  static const std::string& Owner(const Record& r) {
    return r.owner;
  }
};

template <>
struct EntityTraits<model::Subscription> {
  using Record = model::Subscription;

  static constexpr std::string_view kName       = "subscription";
  static constexpr bool             HasAltitude = false;

  static std::optional<Record> Get(db::Repository& repo, db::Transaction& tx, const std::string& id) {
    return repo.GetSubscription(tx, id);
  }
  static std::vector<Record> Search(db::Repository& repo, db::Transaction& tx, const model::SearchFilter& filter) {
    return repo.SearchSubscriptions(tx, filter);
  }
  static db::Result Upsert(db::Repository& repo, db::Transaction& tx, Record& r, std::optional<util::TimePoint> expected) {
    return repo.UpsertSubscription(tx, r, expected);
  }
  static db::Result Delete(db::Repository& repo, db::Transaction& tx, const std::string& id) {
    return repo.DeleteSubscription(tx, id);
  }
  static std::string& Token(Record& r) {
    return r.version;
  }
  static const std::string& Owner(const Record& r) {
    return r.owner;
  }
};

template <>
struct EntityTraits<model::OperationalIntent> {
  using Record = model::OperationalIntent;

  static constexpr std::string_view kName       = "operational_intent";
  static constexpr bool             HasAltitude = true;

  static std::optional<Record> Get(db::Repository& repo, db::Transaction& tx, const std::string& id) {
    return repo.GetOperationalIntent(tx, id);
  }
  static std::vector<Record> Search(db::Repository& repo, db::Transaction& tx, const model::SearchFilter& filter) {
    return repo.SearchOperationalIntents(tx, filter);
  }
  static db::Result Upsert(db::Repository& repo, db::Transaction& tx, Record& r, std::optional<util::TimePoint> expected) {
    return repo.UpsertOperationalIntent(tx, r, expected);
  }
  static db::Result Delete(db::Repository& repo, db::Transaction& tx, const std::string& id) {
    return repo.DeleteOperationalIntent(tx, id);
  }
  static std::string& Token(Record& r) {
    return r.ovn;
  }
  static const std::string& Owner(const Record& r) {
    return r.manager;
  }
};

} // namespace airspace::store
