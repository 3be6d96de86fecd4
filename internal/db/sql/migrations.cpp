#include "migrations.hpp"

#include <utility>

#include "internal/observability/logging.hpp"

namespace airspace::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (std::size_t i = 0; i < ordered_sql.size(); ++i) {
    try {
      executor.ExecuteSQL(ordered_sql[i]);
    } catch (const std::exception& e) {
      AIRSPACE_LOG_ERROR("schema statement failed",
                         {observability::IntField("index", static_cast<std::int64_t>(i)), observability::StringField("error", e.what())});
      throw;
    }
  }
}

namespace {

// SQLite keeps the cell set as a JSON array and mirrors it into <table>_cells,
// maintained by triggers inside the writing transaction.
std::vector<std::string> SqliteCellIndex(const std::string& table, const std::string& cells_table) {
  return {
      "CREATE TABLE IF NOT EXISTS " + cells_table + " (entity_id TEXT NOT NULL, cell_id INTEGER NOT NULL, PRIMARY KEY (entity_id, cell_id)) WITHOUT ROWID;",
      "CREATE INDEX IF NOT EXISTS " + cells_table + "_cell_idx ON " + cells_table + " (cell_id, entity_id);",
      "CREATE TRIGGER IF NOT EXISTS " + table + "_cells_ai AFTER INSERT ON " + table + " BEGIN INSERT OR IGNORE INTO " + cells_table +
          "(entity_id, cell_id) SELECT NEW.id, value FROM json_each(NEW.cells); END;",
      "CREATE TRIGGER IF NOT EXISTS " + table + "_cells_au AFTER UPDATE OF cells ON " + table + " BEGIN DELETE FROM " + cells_table +
          " WHERE entity_id = OLD.id; INSERT OR IGNORE INTO " + cells_table + "(entity_id, cell_id) SELECT NEW.id, value FROM json_each(NEW.cells); END;",
      "CREATE TRIGGER IF NOT EXISTS " + table + "_cells_ad AFTER DELETE ON " + table + " BEGIN DELETE FROM " + cells_table +
          " WHERE entity_id = OLD.id; END;",
  };
}

std::vector<std::string> BuildSqliteSchema() {
  std::vector<std::string> schema = {
      "CREATE TABLE IF NOT EXISTS identification_service_areas ("
      " id TEXT PRIMARY KEY,"
      " owner TEXT NOT NULL,"
      " url TEXT NOT NULL,"
      " starts_at INTEGER,"
      " ends_at INTEGER,"
      " updated_at INTEGER NOT NULL,"
      " cells TEXT NOT NULL CHECK (json_valid(cells) AND json_array_length(cells) > 0),"
      " CHECK (starts_at IS NULL OR ends_at IS NULL OR starts_at < ends_at));",
      "CREATE INDEX IF NOT EXISTS identification_service_areas_owner_idx ON identification_service_areas (owner);",
      "CREATE INDEX IF NOT EXISTS identification_service_areas_starts_at_idx ON identification_service_areas (starts_at);",
      "CREATE INDEX IF NOT EXISTS identification_service_areas_ends_at_idx ON identification_service_areas (ends_at);",
      "CREATE INDEX IF NOT EXISTS identification_service_areas_updated_at_idx ON identification_service_areas (updated_at);",

      "CREATE TABLE IF NOT EXISTS subscriptions ("
      " id TEXT PRIMARY KEY,"
      " owner TEXT NOT NULL,"
      " url TEXT NOT NULL,"
      " notification_index INTEGER NOT NULL DEFAULT 0,"
      " starts_at INTEGER,"
      " ends_at INTEGER,"
      " updated_at INTEGER NOT NULL,"
      " cells TEXT NOT NULL CHECK (json_valid(cells) AND json_array_length(cells) > 0),"
      " CHECK (starts_at IS NULL OR ends_at IS NULL OR starts_at < ends_at));",
      "CREATE INDEX IF NOT EXISTS subscriptions_owner_idx ON subscriptions (owner);",
      "CREATE INDEX IF NOT EXISTS subscriptions_starts_at_idx ON subscriptions (starts_at);",
      "CREATE INDEX IF NOT EXISTS subscriptions_ends_at_idx ON subscriptions (ends_at);",

      "CREATE TABLE IF NOT EXISTS operational_intents ("
      " id TEXT PRIMARY KEY,"
      " owner TEXT NOT NULL,"
      " version INTEGER NOT NULL,"
      " url TEXT NOT NULL,"
      " altitude_lower REAL,"
      " altitude_upper REAL,"
      " starts_at INTEGER,"
      " ends_at INTEGER,"
      " subscription_id TEXT,"
      " updated_at INTEGER NOT NULL,"
      " state TEXT NOT NULL,"
      " cells TEXT NOT NULL CHECK (json_valid(cells) AND json_array_length(cells) > 0),"
      " CHECK (starts_at IS NULL OR ends_at IS NULL OR starts_at < ends_at));",
      "CREATE INDEX IF NOT EXISTS operational_intents_owner_idx ON operational_intents (owner);",
      "CREATE INDEX IF NOT EXISTS operational_intents_starts_at_idx ON operational_intents (starts_at);",
      "CREATE INDEX IF NOT EXISTS operational_intents_ends_at_idx ON operational_intents (ends_at);",
      "CREATE INDEX IF NOT EXISTS operational_intents_subscription_id_idx ON operational_intents (subscription_id);",
  };

  for (const auto& [table, cells_table] : {std::pair<std::string, std::string>{"identification_service_areas", "identification_service_area_cells"},
                                           {"subscriptions", "subscription_cells"},
                                           {"operational_intents", "operational_intent_cells"}}) {
    auto index = SqliteCellIndex(table, cells_table);
    schema.insert(schema.end(), index.begin(), index.end());
  }
  return schema;
}

std::vector<std::string> BuildPostgresSchema() {
  return {
      "CREATE TABLE IF NOT EXISTS identification_service_areas ("
      " id TEXT PRIMARY KEY,"
      " owner TEXT NOT NULL,"
      " url TEXT NOT NULL,"
      " starts_at TIMESTAMPTZ,"
      " ends_at TIMESTAMPTZ,"
      " updated_at TIMESTAMPTZ NOT NULL,"
      " cells BIGINT[] NOT NULL CHECK (cardinality(cells) > 0),"
      " CHECK (starts_at IS NULL OR ends_at IS NULL OR starts_at < ends_at));",
      "CREATE INDEX IF NOT EXISTS identification_service_areas_cells_idx ON identification_service_areas USING GIN (cells);",
      "CREATE INDEX IF NOT EXISTS identification_service_areas_owner_idx ON identification_service_areas (owner);",
      "CREATE INDEX IF NOT EXISTS identification_service_areas_starts_at_idx ON identification_service_areas (starts_at);",
      "CREATE INDEX IF NOT EXISTS identification_service_areas_ends_at_idx ON identification_service_areas (ends_at);",
      "CREATE INDEX IF NOT EXISTS identification_service_areas_updated_at_idx ON identification_service_areas (updated_at);",

      "CREATE TABLE IF NOT EXISTS subscriptions ("
      " id TEXT PRIMARY KEY,"
      " owner TEXT NOT NULL,"
      " url TEXT NOT NULL,"
      " notification_index BIGINT NOT NULL DEFAULT 0,"
      " starts_at TIMESTAMPTZ,"
      " ends_at TIMESTAMPTZ,"
      " updated_at TIMESTAMPTZ NOT NULL,"
      " cells BIGINT[] NOT NULL CHECK (cardinality(cells) > 0),"
      " CHECK (starts_at IS NULL OR ends_at IS NULL OR starts_at < ends_at));",
      "CREATE INDEX IF NOT EXISTS subscriptions_cells_idx ON subscriptions USING GIN (cells);",
      "CREATE INDEX IF NOT EXISTS subscriptions_owner_idx ON subscriptions (owner);",
      "CREATE INDEX IF NOT EXISTS subscriptions_starts_at_idx ON subscriptions (starts_at);",
      "CREATE INDEX IF NOT EXISTS subscriptions_ends_at_idx ON subscriptions (ends_at);",

      "CREATE TABLE IF NOT EXISTS operational_intents ("
      " id TEXT PRIMARY KEY,"
      " owner TEXT NOT NULL,"
      " version BIGINT NOT NULL,"
      " url TEXT NOT NULL,"
      " altitude_lower DOUBLE PRECISION,"
      " altitude_upper DOUBLE PRECISION,"
      " starts_at TIMESTAMPTZ,"
      " ends_at TIMESTAMPTZ,"
      " subscription_id TEXT,"
      " updated_at TIMESTAMPTZ NOT NULL,"
      " state TEXT NOT NULL,"
      " cells BIGINT[] NOT NULL CHECK (cardinality(cells) > 0),"
      " CHECK (starts_at IS NULL OR ends_at IS NULL OR starts_at < ends_at));",
      "CREATE INDEX IF NOT EXISTS operational_intents_cells_idx ON operational_intents USING GIN (cells);",
      "CREATE INDEX IF NOT EXISTS operational_intents_owner_idx ON operational_intents (owner);",
      "CREATE INDEX IF NOT EXISTS operational_intents_starts_at_idx ON operational_intents (starts_at);",
      "CREATE INDEX IF NOT EXISTS operational_intents_ends_at_idx ON operational_intents (ends_at);",
      "CREATE INDEX IF NOT EXISTS operational_intents_subscription_id_idx ON operational_intents (subscription_id);",
  };
}

} // namespace

const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> schema = BuildSqliteSchema();
  return schema;
}

const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> schema = BuildPostgresSchema();
  return schema;
}

} // namespace airspace::db::sql
