#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using tender::config::ConfigLoader;
using tender::runtime::config::DatabaseConfig;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "tender_manager_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullDocument() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "127.0.0.1:6000"
database:
  sqlite:
    path: "/tmp/tender.db"
    wal_mode: true
access:
  authority: "city-council"
  evaluators: ["eval-1", "eval-2"]
logging:
  level: "debug"
observability:
  tracing_enabled: false
  metrics_enabled: true
  transport: OTLP_TRANSPORT_HTTP
  metrics:
    collection_interval_ms: 5000
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1:6000");
  assert(config.database().backend_case() == DatabaseConfig::kSqlite);
  assert(config.database().sqlite().path() == "/tmp/tender.db");
  assert(config.database().sqlite().wal_mode());
  assert(config.access().authority() == "city-council");
  assert(config.access().evaluators_size() == 2);
  assert(config.access().evaluators(1) == "eval-2");
  assert(config.logging().level() == "debug");
  assert(config.observability().metrics_enabled());
  assert(config.observability().transport() == tender::runtime::config::OTLP_TRANSPORT_HTTP);
  assert(config.observability().metrics().collection_interval_ms() == 5000);
}

void TestQuotedIdentitiesStayStrings() {
  auto config = ConfigLoader::LoadFromString(R"(access:
  authority: "0x1234"
  evaluators: ["42", "true"]
)");

  assert(config.access().authority() == "0x1234");
  assert(config.access().evaluators(0) == "42");
  assert(config.access().evaluators(1) == "true");
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  auto config = ConfigLoader::LoadFromString(R"(database:
  sqlite:
    path: "C:\\tender\\\"quoted\"\\db.sqlite"
)");

  assert(config.database().sqlite().path() == "C:\\tender\\\"quoted\"\\db.sqlite");
}

void TestDefaults() {
  auto config = ConfigLoader::LoadFromString("");
  assert(config.server().bind_address() == "0.0.0.0:50061");
  assert(config.database().backend_case() == DatabaseConfig::kMemory);

  auto explicit_memory = ConfigLoader::LoadFromString(R"(database:
  memory: {}
)");
  assert(explicit_memory.database().backend_case() == DatabaseConfig::kMemory);
}

void TestUnknownFieldsAreRejected() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromString(R"(server:
  bind_address: "0.0.0.0:50061"
unknown_field: 123
)");
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/tender-manager.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw);
}

} // namespace

int main() {
  TestFullDocument();
  TestQuotedIdentitiesStayStrings();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestDefaults();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsReported();

  std::cout << "tender_manager_unit_config_loader: pass\n";
  return 0;
}
