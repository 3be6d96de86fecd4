#pragma once

#include <cstdint>
#include <memory>

#include "internal/db/sql/sql_repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace airspace::db::postgres {

// Column conversions; a value that does not convert is DbError(Corruption).
int64_t FieldToInt64(const pqxx::field& field);
double  FieldToDouble(const pqxx::field& field);

class PgRepository final : public sql::SqlRepository {
 public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;

  void Bootstrap() override;

 protected:
  void Query(Transaction& tx, const std::string& sql, const sql::Params& params, const RowVisitor& visit) override;

 private:
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
};

} // namespace airspace::db::postgres
