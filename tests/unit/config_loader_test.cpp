#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/config/engine_options.hpp"
#include "internal/observability/logging.hpp"

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "ainp_broker_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigFromFile() {
  const auto yaml_path = WriteYaml("full",
                                   R"(database:
  sqlite:
    path: "/var/lib/ainp/broker.db"
    wal_mode: true
logging:
  level: debug
negotiation:
  enabled: true
  default_max_rounds: 5
  max_rounds_limit: 12
  default_ttl_minutes: 15
settlement:
  enabled: false
  atomic_unit_scale: 100
  broker_did: "did:key:z6MkBroker"
maintenance:
  expiry_interval: 10s
  reconcile_interval: "1.5s"
  reconcile_batch: 7
)");

  auto config = ainp::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/var/lib/ainp/broker.db");
  assert(config.database().sqlite().wal_mode());
  assert(config.logging().level() == "debug");

  auto options = ainp::config::BuildEngineOptions(config);
  assert(options.negotiation_enabled);
  assert(options.default_max_rounds == 5);
  assert(options.max_rounds_limit == 12);
  assert(options.default_ttl_minutes == 15);
  assert(!options.settlement_enabled);
  assert(options.atomic_unit_scale == 100);
  assert(options.broker_did == "did:key:z6MkBroker");
  assert(options.expiry_interval == std::chrono::seconds(10));
  assert(options.reconcile_interval == std::chrono::milliseconds(1500));
  assert(options.reconcile_batch == 7);
}

void TestEmptyConfigKeepsDefaults() {
  auto config  = ainp::config::ConfigLoader::LoadFromYamlString("");
  auto options = ainp::config::BuildEngineOptions(config);

  assert(!config.database().has_sqlite());
  assert(!config.database().has_postgres());
  assert(options.negotiation_enabled);
  assert(options.settlement_enabled);
  assert(options.default_max_rounds == 10);
  assert(options.max_rounds_limit == 20);
  assert(options.default_ttl_minutes == 60);
  assert(options.atomic_unit_scale == 1000);
  assert(options.broker_did.empty());
  assert(options.expiry_interval == std::chrono::seconds(60));
}

void TestQuotedScalarsStayStrings() {
  auto config = ainp::config::ConfigLoader::LoadFromYamlString(R"(settlement:
  broker_did: "12345"
database:
  postgres:
    connection_uri: "postgresql://ainp@localhost/ainp"
    max_connections: 4
)");

  assert(config.settlement().broker_did() == "12345");
  assert(config.database().postgres().connection_uri() == "postgresql://ainp@localhost/ainp");
  assert(config.database().postgres().max_connections() == 4);
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(negotiation:
  default_max_rounds: 3
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)ainp::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestInconsistentRoundLimitsAreRejected() {
  auto config = ainp::config::ConfigLoader::LoadFromYamlString(R"(negotiation:
  default_max_rounds: 30
)");

  bool threw = false;
  try {
    (void)ainp::config::BuildEngineOptions(config);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestLogLevelNames() {
  assert(ainp::observability::ParseLevel("debug") == spdlog::level::debug);
  assert(ainp::observability::ParseLevel("off") == spdlog::level::off);

  bool threw = false;
  try {
    (void)ainp::observability::ParseLevel("verbose");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigFromFile();
  TestEmptyConfigKeepsDefaults();
  TestQuotedScalarsStayStrings();
  TestUnknownFieldsAreRejected();
  TestInconsistentRoundLimitsAreRejected();
  TestLogLevelNames();

  std::cout << "ainp_unit_config_loader: pass\n";
  return 0;
}
