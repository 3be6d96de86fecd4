#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/factory.hpp"

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "airspace_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

template <typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestSqliteConfigIsLoaded() {
  const auto yaml_path = WriteYaml("sqlite",
                                   R"(database:
  sqlite:
    path: "/var/lib/airspace/store.db"
    busy_timeout_ms: 250
  bootstrap_on_start: true
covering:
  min_level: 12
  max_level: 13
  max_area_km2: 100.5
logging:
  level: debug
)");

  auto config = airspace::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/var/lib/airspace/store.db");
  assert(config.database().sqlite().busy_timeout_ms() == 250);
  assert(config.database().bootstrap_on_start());
  assert(config.covering().min_level() == 12);
  assert(config.covering().max_level() == 13);
  assert(config.covering().level_mod() == 0);
  assert(config.covering().max_area_km2() == 100.5);
  assert(config.logging().level() == "debug");
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database:
  sqlite:
    path: "C:\\airspace\\\"quoted\"\\store.db"
)");

  auto config = airspace::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\airspace\\\"quoted\"\\store.db");
}

void TestQuotedNumbersStayStrings() {
  auto config = airspace::config::ConfigLoader::LoadFromYamlString(R"(database:
  sqlite:
    path: "13"
)");
  assert(config.database().sqlite().path() == "13");
}

void TestPostgresConfigFromString() {
  auto config = airspace::config::ConfigLoader::LoadFromYamlString(R"(database:
  postgres:
    conninfo: "host=localhost dbname=airspace"
    max_connections: 4
)");
  assert(config.database().has_postgres());
  assert(!config.database().has_sqlite());
  assert(config.database().postgres().conninfo() == "host=localhost dbname=airspace");
  assert(config.database().postgres().max_connections() == 4);
  assert(!config.database().bootstrap_on_start());
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(database:
  memory: {}
unknown_field: 123
)");

  bool threw = Throws([&] { (void)airspace::config::ConfigLoader::LoadFromYaml(yaml_path.string()); });
  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsReported() {
  const auto missing = std::filesystem::temp_directory_path() / "airspace_config_loader_tests" / "does_not_exist.yaml";
  assert(Throws([&] { (void)airspace::config::ConfigLoader::LoadFromYaml(missing.string()); }));
}

void TestCoveringPolicyDefaults() {
  airspace::runtime::config::CoveringConfig covering;
  const auto                                policy = airspace::factory::CoveringPolicyFromConfig(covering);
  assert(policy.min_level == 13);
  assert(policy.max_level == 13);
  assert(policy.level_mod == 1);
  assert(policy.max_cells == 100000);
  assert(policy.max_area_km2 == 2500);

  covering.set_max_cells(64);
  assert(airspace::factory::CoveringPolicyFromConfig(covering).max_cells == 64);
}

void TestCoveringPolicyValidation() {
  airspace::runtime::config::CoveringConfig inverted;
  inverted.set_min_level(14);
  inverted.set_max_level(12);
  assert(Throws([&] { airspace::factory::CoveringPolicyFromConfig(inverted); }));

  airspace::runtime::config::CoveringConfig too_deep;
  too_deep.set_max_level(31);
  assert(Throws([&] { airspace::factory::CoveringPolicyFromConfig(too_deep); }));

  airspace::runtime::config::CoveringConfig bad_mod;
  bad_mod.set_level_mod(4);
  assert(Throws([&] { airspace::factory::CoveringPolicyFromConfig(bad_mod); }));

  airspace::runtime::config::CoveringConfig negative_area;
  negative_area.set_max_area_km2(-1);
  assert(Throws([&] { airspace::factory::CoveringPolicyFromConfig(negative_area); }));
}

void TestBuildMemoryRuntime() {
  auto config  = airspace::config::ConfigLoader::LoadFromYamlString(R"(database:
  memory:
    busy_timeout_ms: 100
  bootstrap_on_start: true
)");
  auto runtime = airspace::factory::Build(config);
  assert(runtime.repository != nullptr);
  assert(runtime.store != nullptr);
#if AIRSPACE_GEO_S2
  assert(runtime.covering != nullptr);
  assert(runtime.covering->policy().max_level == 13);
  assert(&runtime.store->covering() == runtime.covering.get());
#endif

  // The covering section is checked whether or not the engine is built in.
  auto bad_levels = airspace::config::ConfigLoader::LoadFromYamlString(R"(database:
  memory: {}
covering:
  min_level: 20
  max_level: 10
)");
  assert(Throws([&] { airspace::factory::Build(bad_levels); }));
}

void TestSqliteWithoutPathIsRejected() {
  airspace::runtime::config::DatabaseConfig database;
  database.mutable_sqlite();
  assert(Throws([&] { airspace::factory::BuildRepository(database); }));
}

} // namespace

int main() {
  TestSqliteConfigIsLoaded();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestQuotedNumbersStayStrings();
  TestPostgresConfigFromString();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsReported();
  TestCoveringPolicyDefaults();
  TestCoveringPolicyValidation();
  TestBuildMemoryRuntime();
  TestSqliteWithoutPathIsRejected();

  std::cout << "airspace_unit_config_loader: pass\n";
  return 0;
}
