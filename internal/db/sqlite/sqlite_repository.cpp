#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <type_traits>
#include <variant>

#include "internal/db/sql/cell_codec.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/observability/logging.hpp"
#include "sqlite_dialect.hpp"

namespace airspace::db::sqlite {

namespace {

class SqliteRow final : public sql::Row {
 public:
  explicit SqliteRow(sqlite3_stmt* st) : st_(st) {
  }

  std::string GetText(int col) const override {
    const unsigned char* t = sqlite3_column_text(st_, col);
    return t ? reinterpret_cast<const char*>(t) : "";
  }

  int64_t GetInt64(int col) const override {
    return static_cast<int64_t>(sqlite3_column_int64(st_, col));
  }

  double GetDouble(int col) const override {
    return sqlite3_column_double(st_, col);
  }

  bool IsNull(int col) const override {
    return sqlite3_column_type(st_, col) == SQLITE_NULL;
  }

 private:
  sqlite3_stmt* st_;
};

struct StatementDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using StatementPtr = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

int Bind(sqlite3_stmt* st, int idx, const sql::Param& param) {
  return std::visit(
      [&](const auto& v) -> int {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
          return sqlite3_bind_null(st, idx);
        } else if constexpr (std::is_same_v<T, int64_t>) {
          return sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
        } else if constexpr (std::is_same_v<T, double>) {
          return sqlite3_bind_double(st, idx, v);
        } else if constexpr (std::is_same_v<T, std::string>) {
          return sqlite3_bind_text(st, idx, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
        } else {
          const std::string json = sql::FormatCellList(v, '[', ']');
          return sqlite3_bind_text(st, idx, json.c_str(), static_cast<int>(json.size()), SQLITE_TRANSIENT);
        }
      },
      param);
}

class SqliteMigrationExecutor final : public sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(SqliteDB& db) : db_(db) {
  }

  void ExecuteSQL(const std::string& sql) override {
    db_.Exec(sql);
  }

 private:
  SqliteDB& db_;
};

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : sql::SqlRepository(std::make_unique<SqliteDialect>()), db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

void SqliteRepository::Bootstrap() {
  // DDL is transactional in SQLite: a failed bootstrap leaves nothing behind.
  SqliteTransaction       tx(db_);
  SqliteMigrationExecutor executor(*db_);
  sql::RunMigrations(executor, sql::SqliteSchema());
  tx.Commit();

  AIRSPACE_LOG_INFO("schema bootstrapped", {observability::StringField("backend", "sqlite")});
}

void SqliteRepository::Query(Transaction& t, const std::string& sql, const sql::Params& params, const RowVisitor& visit) {
  sqlite3* db = TX(t).Handle();

  sqlite3_stmt* raw = nullptr;
  int           rc  = sqlite3_prepare_v2(db, sql.c_str(), static_cast<int>(sql.size()), &raw, nullptr);
  StatementPtr  st(raw);
  if (rc != SQLITE_OK) throw DbError(Translate(db, rc));

  for (std::size_t i = 0; i < params.size(); ++i) {
    rc = Bind(st.get(), static_cast<int>(i + 1), params[i]);
    if (rc != SQLITE_OK) throw DbError(Translate(db, rc));
  }

  SqliteRow row(st.get());
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    visit(row);
  }
  if (rc != SQLITE_DONE) throw DbError(Translate(db, rc));
}

} // namespace airspace::db::sqlite
