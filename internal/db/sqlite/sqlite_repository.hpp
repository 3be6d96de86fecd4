#pragma once

#include <memory>

#include "internal/db/sql/sql_repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace airspace::db::sqlite {

class SqliteRepository final : public sql::SqlRepository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  void Bootstrap() override;

 protected:
  void Query(Transaction& tx, const std::string& sql, const sql::Params& params, const RowVisitor& visit) override;

 private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
};

} // namespace airspace::db::sqlite
