#pragma once

#include <string>
#include <vector>

namespace airspace::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL().
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;
};

/*
  Runs statements in order. Every statement must be idempotent
  (IF NOT EXISTS) so the whole list can run on every process start.
*/

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

/*
  Bootstrap schemas. Three entity tables, each with:
    - non-null, non-empty cell set
    - set-overlap index over the cells
    - owner / starts_at / ends_at indexes
    - CHECK (starts_at < ends_at) when both are present
*/

const std::vector<std::string>& SqliteSchema();
const std::vector<std::string>& PostgresSchema();

} // namespace airspace::db::sql
