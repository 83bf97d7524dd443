#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using workledger::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "workledger_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

template <typename Fn>
bool ThrowsRuntimeError(Fn&& fn) {
  try {
    fn();
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestFullConfigFromFile() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "127.0.0.1:6000"
database:
  sqlite:
    path: "/var/lib/workledger/ledger.db"
    wal_mode: true
logging:
  level: debug
job_queue:
  default_max_attempts: 5
  retry_backoff: "2.5s"
reaper:
  enabled: true
  interval: "10s"
  processing_timeout: "600s"
  batch_limit: 25
  retention_days: 30
ledger:
  default_starting_credits: 250
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1:6000");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/var/lib/workledger/ledger.db");
  assert(config.database().sqlite().wal_mode());
  assert(config.logging().level() == "debug");
  assert(config.job_queue().default_max_attempts() == 5);
  assert(config.job_queue().retry_backoff().seconds() == 2);
  assert(config.job_queue().retry_backoff().nanos() == 500000000);
  assert(config.reaper().enabled());
  assert(config.reaper().interval().seconds() == 10);
  assert(config.reaper().processing_timeout().seconds() == 600);
  assert(config.reaper().batch_limit() == 25);
  assert(config.reaper().retention_days() == 30);
  assert(config.ledger().default_starting_credits() == 250);
}

void TestEmptyDocumentGetsDefaults() {
  auto config = ConfigLoader::LoadFromYamlString("");
  assert(config.server().bind_address() == "0.0.0.0:50061");
  assert(!config.database().has_sqlite());
  assert(!config.database().has_postgres());
  assert(config.job_queue().default_max_attempts() == 3);
  assert(config.job_queue().cleanup_older_than_days() == 30);
  assert(config.reaper().interval().seconds() == 30);
  assert(config.reaper().processing_timeout().seconds() == 900);
  assert(config.reaper().batch_limit() == 100);
  assert(config.reaper().retention_days() == 0);
  assert(config.ledger().default_starting_credits() == 100);
}

void TestExplicitZeroStartingCreditsIsKept() {
  auto config = ConfigLoader::LoadFromYamlString("ledger:\n  default_starting_credits: 0\n");
  assert(config.ledger().has_default_starting_credits());
  assert(config.ledger().default_starting_credits() == 0);
}

void TestPostgresGetsPoolDefault() {
  auto config = ConfigLoader::LoadFromYamlString(R"(database:
  postgres:
    connection_uri: "postgresql://localhost/workledger"
)");
  assert(config.database().postgres().connection_uri() == "postgresql://localhost/workledger");
  assert(config.database().postgres().max_connections() == 8);
}

void TestQuotedNumericStringsStayStrings() {
  auto config = ConfigLoader::LoadFromYamlString(R"(database:
  sqlite:
    path: "0100"
)");
  assert(config.database().sqlite().path() == "0100");
}

void TestUnknownFieldsAreRejected() {
  assert(ThrowsRuntimeError([] { (void)ConfigLoader::LoadFromYamlString("server:\n  bind_address: \"x:1\"\nunknown_field: 123\n"); }));
}

void TestInvalidValuesAreRejected() {
  assert(ThrowsRuntimeError([] { (void)ConfigLoader::LoadFromYamlString("database:\n  sqlite:\n    wal_mode: true\n"); }));
  assert(ThrowsRuntimeError([] { (void)ConfigLoader::LoadFromYamlString("job_queue:\n  default_max_attempts: 101\n"); }));
  assert(ThrowsRuntimeError([] { (void)ConfigLoader::LoadFromYamlString("job_queue:\n  retry_backoff: \"-1s\"\n"); }));
  assert(ThrowsRuntimeError([] { (void)ConfigLoader::LoadFromYamlString("ledger:\n  default_starting_credits: -5\n"); }));
  assert(ThrowsRuntimeError([] { (void)ConfigLoader::LoadFromYamlString("- just\n- a list\n"); }));
  assert(ThrowsRuntimeError([] { (void)ConfigLoader::LoadFromYaml("/nonexistent/workledger.yaml"); }));
}

} // namespace

int main() {
  TestFullConfigFromFile();
  TestEmptyDocumentGetsDefaults();
  TestExplicitZeroStartingCreditsIsKept();
  TestPostgresGetsPoolDefault();
  TestQuotedNumericStringsStayStrings();
  TestUnknownFieldsAreRejected();
  TestInvalidValuesAreRejected();

  std::cout << "workledger_unit_config_loader: pass\n";
  return 0;
}
