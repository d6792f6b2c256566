#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using vesting::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "vesting_ledger_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool ValidateThrows(const vesting::runtime::config::RuntimeConfig& config) {
  try {
    ConfigLoader::Validate(config);
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

const char* kValidYaml = R"(server:
  bind_address: "0.0.0.0:50061"
database:
  sqlite:
    allocation_path: "/var/lib/vesting/allocation.db"
    vesting_path: "/var/lib/vesting/vesting.db"
ledger:
  admin_address: 0x00000000000000000000000000000000000000A1
  engine_address: "0x00000000000000000000000000000000000000e1"
  token_max_supply: "1000000000000000000000000000000"
logging:
  level: debug
observability:
  tracing_enabled: false
  metrics_enabled: true
  transport: OTLP_TRANSPORT_HTTP
  metrics:
    collection_interval_ms: 2500
)";

void TestLoadsFullConfig() {
  const auto config = ConfigLoader::LoadFromYaml(WriteYaml("full", kValidYaml).string());

  assert(config.server().bind_address() == "0.0.0.0:50061");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().vesting_path() == "/var/lib/vesting/vesting.db");
  // unquoted hex stays a string
  assert(config.ledger().admin_address() == "0x00000000000000000000000000000000000000A1");
  // quoted digits beyond double precision survive intact
  assert(config.ledger().token_max_supply() == "1000000000000000000000000000000");
  assert(config.logging().level() == "debug");
  assert(config.observability().metrics_enabled());
  assert(config.observability().transport() == vesting::runtime::config::OTLP_TRANSPORT_HTTP);
  assert(config.observability().metrics().collection_interval_ms() == 2500);

  ConfigLoader::Validate(config);
}

void TestMemoryBackendFromEmptyMap() {
  const auto config = ConfigLoader::LoadFromYaml(WriteYaml("memory", R"(server:
  bind_address: "127.0.0.1:0"
database:
  memory: {}
ledger:
  admin_address: "0x00000000000000000000000000000000000000a1"
  engine_address: "0x00000000000000000000000000000000000000e1"
)")
                                                     .string());

  assert(config.database().has_memory());
  assert(config.ledger().token_max_supply().empty());
  ConfigLoader::Validate(config);
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field", R"(server:
  bind_address: "0.0.0.0:50061"
  unknown_field: 123
database:
  memory: {}
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsAnError() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/vesting-ledger.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestValidationRejectsBadLedgerSettings() {
  const auto base = ConfigLoader::LoadFromYaml(WriteYaml("base", kValidYaml).string());

  auto no_backend = base;
  no_backend.mutable_database()->clear_backend();
  assert(ValidateThrows(no_backend));

  auto no_bind = base;
  no_bind.mutable_server()->clear_bind_address();
  assert(ValidateThrows(no_bind));

  auto shared_file = base;
  shared_file.mutable_database()->mutable_sqlite()->set_vesting_path("/var/lib/vesting/allocation.db");
  assert(ValidateThrows(shared_file));

  auto bad_admin = base;
  bad_admin.mutable_ledger()->set_admin_address("0x1234");
  assert(ValidateThrows(bad_admin));

  auto zero_engine = base;
  zero_engine.mutable_ledger()->set_engine_address("0x0000000000000000000000000000000000000000");
  assert(ValidateThrows(zero_engine));

  auto same_identity = base;
  same_identity.mutable_ledger()->set_engine_address("0x00000000000000000000000000000000000000a1");
  assert(ValidateThrows(same_identity));

  auto bad_supply = base;
  bad_supply.mutable_ledger()->set_token_max_supply("1e27");
  assert(ValidateThrows(bad_supply));

  auto zero_supply = base;
  zero_supply.mutable_ledger()->set_token_max_supply("0");
  assert(ValidateThrows(zero_supply));
}

} // namespace

int main() {
  TestLoadsFullConfig();
  TestMemoryBackendFromEmptyMap();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsAnError();
  TestValidationRejectsBadLedgerSettings();

  std::cout << "vesting_ledger_unit_config_loader: pass\n";
  return 0;
}
