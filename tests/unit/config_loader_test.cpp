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
  const auto base_dir = std::filesystem::temp_directory_path() / "outflow_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejects(const std::string& yaml) {
  try {
    (void)outflow::config::ConfigLoader::LoadFromYamlString(yaml);
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestFullConfigIsParsed() {
  const auto yaml_path = WriteYaml("full",
                                   R"(database:
  sqlite:
    path: "/tmp/outflow.db"
    wal_mode: true
    busy_timeout: "2s"
logging:
  level: "debug"
retry:
  max_attempts: 7
  initial_backoff: "0.010s"
  max_backoff: "0.5s"
  multiplier: 1.5
reservations:
  default_ttl: "3600s"
approvals:
  max_level: 4
  protected_roles:
    - "super_admin"
    - "auditor"
cost:
  labor_rate_per_hour: 60000
  tax_percent: 5
)");

  auto config = outflow::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/tmp/outflow.db");
  assert(config.database().sqlite().wal_mode());
  assert(config.database().sqlite().busy_timeout().seconds() == 2);
  assert(config.logging().level() == "debug");
  assert(config.reservations().default_ttl().seconds() == 3600);
  assert(config.approvals().max_level() == 4);
  assert(config.approvals().protected_roles_size() == 2);

  const auto retry = outflow::factory::BuildRetryPolicy(config);
  assert(retry.max_attempts == 7);
  assert(retry.initial_backoff.count() == 10);
  assert(retry.max_backoff.count() == 500);
  assert(retry.multiplier == 1.5);

  // Unset rates keep their defaults.
  const auto rates = outflow::factory::BuildCostRates(config);
  assert(rates.labor_rate_per_hour == 60000);
  assert(rates.tax_percent == 5.0);
  assert(rates.labor_markup_percent == 20.0);
  assert(rates.overhead_percent == 10.0);
}

void TestEmptyDocumentYieldsDefaults() {
  auto config = outflow::config::ConfigLoader::LoadFromYamlString("");
  assert(!config.database().has_sqlite());
  assert(!config.database().has_postgres());

  const auto rates = outflow::factory::BuildCostRates(config);
  assert(rates.labor_rate_per_hour == 50000);
  assert(rates.tax_percent == 18.0);
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  auto config = outflow::config::ConfigLoader::LoadFromYamlString(R"(database:
  sqlite:
    path: "C:\\outflow\\\"quoted\"\\db.sqlite"
)");
  assert(config.database().sqlite().path() == "C:\\outflow\\\"quoted\"\\db.sqlite");
}

void TestUnknownFieldsAreRejected() {
  assert(Rejects(R"(database:
  memory: {}
unknown_field: 123
)") && "ConfigLoader must reject unknown fields.");
}

void TestValidationRejectsBadRanges() {
  assert(Rejects("database:\n  sqlite:\n    path: \"\"\n"));
  assert(Rejects("database:\n  postgres:\n    connection_uri: \"\"\n"));
  assert(Rejects("retry:\n  multiplier: 0.5\n"));
  assert(Rejects("cost:\n  tax_percent: -1\n"));
  assert(Rejects("cost:\n  labor_rate_per_hour: -100\n"));
  assert(Rejects("approvals:\n  protected_roles:\n    - \"\"\n"));
}

void TestMissingFileIsRejected() {
  bool threw = false;
  try {
    (void)outflow::config::ConfigLoader::LoadFromYaml("/nonexistent/outflow.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigIsParsed();
  TestEmptyDocumentYieldsDefaults();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestUnknownFieldsAreRejected();
  TestValidationRejectsBadRanges();
  TestMissingFileIsRejected();

  std::cout << "outflow_unit_config_loader: pass\n";
  return 0;
}
