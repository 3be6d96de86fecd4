#include "pg_repository.hpp"

#include <string>
#include <type_traits>
#include <variant>

#include "internal/db/sql/cell_codec.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/observability/logging.hpp"
#include "pg_dialect.hpp"

namespace airspace::db::postgres {

namespace {

// Serializes concurrent bootstraps; CREATE ... IF NOT EXISTS is not race-free in postgres.
constexpr int64_t kBootstrapLockKey = 0x41495253504143; // "AIRSPAC"

class PgRow final : public sql::Row {
 public:
  explicit PgRow(const pqxx::row& row) : row_(row) {
  }

  std::string GetText(int col) const override {
    return row_[col].c_str();
  }

  int64_t GetInt64(int col) const override {
    return FieldToInt64(row_[col]);
  }

  double GetDouble(int col) const override {
    return FieldToDouble(row_[col]);
  }

  bool IsNull(int col) const override {
    return row_[col].is_null();
  }

 private:
  const pqxx::row& row_;
};

pqxx::params ToPqxx(const sql::Params& params) {
  pqxx::params out;
  for (const auto& param : params) {
    std::visit(
        [&](const auto& v) {
          using T = std::decay_t<decltype(v)>;
          if constexpr (std::is_same_v<T, std::nullptr_t>) {
            out.append();
          } else if constexpr (std::is_same_v<T, model::CellSet>) {
            out.append(sql::FormatCellList(v, '{', '}'));
          } else {
            out.append(v);
          }
        },
        param);
  }
  return out;
}

class PgMigrationExecutor final : public sql::MigrationExecutor {
 public:
  explicit PgMigrationExecutor(pqxx::work& work) : work_(work) {
  }

  void ExecuteSQL(const std::string& sql) override {
    work_.exec(sql);
  }

 private:
  pqxx::work& work_;
};

} // namespace

int64_t FieldToInt64(const pqxx::field& field) {
  try {
    return field.as<int64_t>();
  } catch (const pqxx::conversion_error& e) {
    throw DbError(ErrorCode::Corruption, std::string("column ") + field.name() + ": " + e.what());
  }
}

double FieldToDouble(const pqxx::field& field) {
  try {
    return field.as<double>();
  } catch (const pqxx::conversion_error& e) {
    throw DbError(ErrorCode::Corruption, std::string("column ") + field.name() + ": " + e.what());
  }
}

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : sql::SqlRepository(std::make_unique<PgDialect>()), pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

void PgRepository::Bootstrap() {
  PgTransaction tx(pool_);
  try {
    tx.Work().exec_params("SELECT pg_advisory_xact_lock($1)", kBootstrapLockKey);
    PgMigrationExecutor executor(tx.Work());
    sql::RunMigrations(executor, sql::PostgresSchema());
  } catch (const pqxx::failure& e) {
    throw DbError(Translate(e));
  }
  tx.Commit();

  AIRSPACE_LOG_INFO("schema bootstrapped", {observability::StringField("backend", "postgres")});
}

void PgRepository::Query(Transaction& t, const std::string& sql, const sql::Params& params, const RowVisitor& visit) {
  pqxx::result res;
  try {
    res = TX(t).Work().exec_params(sql, ToPqxx(params));
  } catch (const pqxx::failure& e) {
    throw DbError(Translate(e));
  }

  for (const auto& row : res) {
    PgRow wrapped(row);
    visit(wrapped);
  }
}

} // namespace airspace::db::postgres
