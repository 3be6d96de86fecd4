#include <iostream>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

static void Usage() {
  std::cerr << "Usage:\n"
            << "  airspace-admin --config <config.yaml> bootstrap\n"
            << "  airspace-admin --config <config.yaml> dependents <subscription_id>\n";
}

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);
  if (args.size() < 3 || args[0] != "--config") {
    Usage();
    return 1;
  }

  const std::string& config_path = args[1];
  const std::string& command     = args[2];

  if (!(command == "bootstrap" && args.size() == 3) && !(command == "dependents" && args.size() == 4)) {
    Usage();
    return 1;
  }

  try {
    auto config = airspace::config::ConfigLoader::LoadFromYaml(config_path);
    airspace::observability::InitializeLogging(config.logging());

    auto runtime = airspace::factory::Build(config);

    if (command == "bootstrap") {
      runtime.store->Bootstrap();
      AIRSPACE_LOG_INFO("bootstrap complete");
    } else {
      for (const auto& id : runtime.store->DependentsOfSubscription(args[3])) {
        std::cout << id << "\n";
      }
    }

    airspace::observability::ShutdownLogging();
  } catch (const airspace::util::BackingStoreFault& e) {
    AIRSPACE_LOG_ERROR("backing store failure",
                       {airspace::observability::StringField("code", e.code()), airspace::observability::StringField("error", e.what())});
    airspace::observability::ShutdownLogging();
    return 3;
  } catch (const std::exception& e) {
    AIRSPACE_LOG_ERROR("Fatal error", {airspace::observability::StringField("error", e.what())});
    airspace::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
