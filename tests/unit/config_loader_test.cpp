#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using claims::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "claims_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigMapsOntoOptions() {
  const auto yaml_path = WriteYaml("full",
                                   R"(database:
  sqlite:
    path: "/var/lib/claims/claims.db"
    wal_mode: false
claims:
  agent_ttl: 120s
  human_ttl: "7200s"
  max_steal_count: 3
  requeue_on_abandon: true
  agent_expiry: EXPIRY_ACTION_EXPIRE
  human_expiry: EXPIRY_ACTION_REQUEUE
work_stealing:
  enabled: true
  interval: 15s
  idle_threshold: 7.5s
  stale_threshold: 60s
  allow_cross_domain: true
  max_steals_per_cycle: 4
  cycle_deadline: 2s
expiry:
  enabled: false
  interval: 45s
  sweep_deadline: 1s
events:
  audit_log_path: /tmp/claims-audit.jsonl
logging:
  level: debug
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/var/lib/claims/claims.db");
  assert(config.database().sqlite().has_wal_mode() && !config.database().sqlite().wal_mode());
  assert(config.events().audit_log_path() == "/tmp/claims-audit.jsonl");
  assert(config.logging().level() == "debug");

  auto service = claims::config::ToServiceOptions(config);
  assert(service.agent_ttl_ms == 120000);
  assert(service.human_ttl_ms == 7200000);
  assert(service.max_steal_count == 3);
  assert(service.requeue_on_abandon);
  assert(service.agent_expiry == claims::service::ExpiryAction::kExpire);
  assert(service.human_expiry == claims::service::ExpiryAction::kRequeue);

  auto stealing = claims::config::ToWorkStealingOptions(config);
  assert(stealing.enabled);
  assert(stealing.interval == std::chrono::seconds(15));
  assert(stealing.idle_threshold_ms == 7500);
  assert(stealing.stale_threshold_ms == 60000);
  assert(stealing.allow_cross_domain);
  assert(stealing.max_steals_per_cycle == 4);
  assert(stealing.cycle_deadline == std::chrono::seconds(2));

  auto expiry = claims::config::ToExpiryOptions(config);
  assert(!expiry.enabled);
  assert(expiry.interval == std::chrono::seconds(45));
  assert(expiry.sweep_deadline == std::chrono::seconds(1));
}

void TestDefaultsWhenSectionsAreMissing() {
  auto config = ConfigLoader::LoadFromYamlString("database:\n  memory: {}\n");
  assert(config.database().has_memory());

  auto service = claims::config::ToServiceOptions(config);
  assert(service.agent_ttl_ms == 300000);
  assert(service.human_ttl_ms == 3600000);
  assert(!service.requeue_on_abandon);
  assert(service.agent_expiry == claims::service::ExpiryAction::kRequeue);
  assert(service.human_expiry == claims::service::ExpiryAction::kExpire);

  auto stealing = claims::config::ToWorkStealingOptions(config);
  assert(stealing.enabled);
  assert(stealing.interval == std::chrono::seconds(10));
  assert(stealing.idle_threshold_ms == 5000);
  assert(stealing.stale_threshold_ms == 0);
  assert(!stealing.allow_cross_domain);
  assert(stealing.max_steals_per_cycle == 0);

  auto expiry = claims::config::ToExpiryOptions(config);
  assert(expiry.enabled);
  assert(expiry.interval == std::chrono::seconds(30));

  auto empty = ConfigLoader::LoadFromYamlString("");
  assert(!empty.has_database());
}

void TestQuotedScalarsStayStrings() {
  auto config = ConfigLoader::LoadFromYamlString(R"(database:
  postgres:
    connection_uri: "postgresql://claims:\"pw\"@db/claims"
    max_connections: 8
events:
  audit_log_path: "12345"
)");
  assert(config.database().postgres().connection_uri() == "postgresql://claims:\"pw\"@db/claims");
  assert(config.database().postgres().max_connections() == 8);
  assert(config.events().audit_log_path() == "12345");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(database:
  memory: {}
work_stealing:
  idle_treshold: 5s
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestInvalidValuesAreRejected() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYamlString("- not\n- a\n- map\n");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/claims.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  auto zero_ttl = ConfigLoader::LoadFromYamlString("claims:\n  agent_ttl: 0s\n");
  threw         = false;
  try {
    (void)claims::config::ToServiceOptions(zero_ttl);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  auto negative_idle = ConfigLoader::LoadFromYamlString("work_stealing:\n  idle_threshold: -1s\n");
  threw              = false;
  try {
    (void)claims::config::ToWorkStealingOptions(negative_idle);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigMapsOntoOptions();
  TestDefaultsWhenSectionsAreMissing();
  TestQuotedScalarsStayStrings();
  TestUnknownFieldsAreRejected();
  TestInvalidValuesAreRejected();

  std::cout << "claims_unit_config_loader: pass\n";
  return 0;
}
