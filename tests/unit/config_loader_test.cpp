#include "internal/config/config_loader.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using routebid::config::ConfigLoader;
namespace cfg = routebid::runtime::config;

bool ThrowsWith(const std::string& yaml, const std::string& prefix) {
  try {
    ConfigLoader::LoadFromYamlString(yaml);
  } catch (const std::runtime_error& e) {
    return std::string(e.what()).rfind(prefix, 0) == 0;
  }
  return false;
}

void TestLoadsFullDocument() {
  const auto config = ConfigLoader::LoadFromYamlString(R"(
server:
  bind_address: "127.0.0.1:6000"
database:
  sqlite:
    path: "/var/lib/routebid/routebid.db"
    wal_mode: true
logging:
  level: "debug"
bidding:
  base_window: "7200s"
  extension_window: "1800s"
  max_extensions: 3
  warning_lead: "600s"
scheduler:
  disabled: true
  sweep_interval: "5s"
locking:
  acquire_timeout: "0.250s"
  max_attempts: 4
  retry_backoff: "0.010s"
observability:
  tracing_enabled: false
  transport: "OTLP_TRANSPORT_HTTP"
)");

  assert(config.server().bind_address() == "127.0.0.1:6000");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/var/lib/routebid/routebid.db");
  assert(config.database().sqlite().wal_mode());
  assert(config.logging().level() == "debug");
  assert(config.scheduler().disabled());
  assert(config.observability().transport() == cfg::OTLP_TRANSPORT_HTTP);

  const auto policy = routebid::config::ToBiddingPolicy(config);
  assert(policy.base_window == std::chrono::hours(2));
  assert(policy.extension_window == std::chrono::minutes(30));
  assert(policy.max_extensions == 3);
  assert(policy.warning_lead == std::chrono::minutes(10));

  const auto locks = routebid::config::ToLockOptions(config);
  assert(locks.acquire_timeout == std::chrono::milliseconds(250));
  assert(locks.max_attempts == 4);
  assert(locks.retry_backoff == std::chrono::milliseconds(10));

  assert(routebid::config::SweepInterval(config) == std::chrono::seconds(5));
}

void TestZeroValuesFallBackToDefaults() {
  const auto config = ConfigLoader::LoadFromYamlString("bidding:\n  max_extensions: 0\n");

  const routebid::lifecycle::BiddingPolicy defaults;
  const auto                               policy = routebid::config::ToBiddingPolicy(config);
  assert(policy.base_window == defaults.base_window);
  assert(policy.extension_window == defaults.extension_window);
  assert(policy.max_extensions == defaults.max_extensions);
  assert(policy.warning_lead == defaults.warning_lead);

  assert(routebid::config::ToLockOptions(config).max_attempts == routebid::lock::LockOptions{}.max_attempts);
  assert(routebid::config::SweepInterval(config) == routebid::config::kDefaultSweepInterval);
}

void TestEmptyDocumentIsDefaultConfig() {
  const auto config = ConfigLoader::LoadFromYamlString("");
  assert(config.server().bind_address().empty());
  assert(!config.database().has_sqlite());
  assert(!config.scheduler().disabled());
}

void TestRejectsBadInput() {
  assert(ThrowsWith("server:\n  bind_addres: \"x\"\n", "Invalid configuration:"));
  assert(ThrowsWith("- one\n- two\n", "Invalid configuration:"));
  assert(ThrowsWith("server: [unclosed\n", "Failed to parse YAML config:"));

  const auto negative = ConfigLoader::LoadFromYamlString("scheduler:\n  sweep_interval: \"-5s\"\n");
  bool       threw    = false;
  try {
    routebid::config::SweepInterval(negative);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestLoadsFromFile() {
  const auto path = std::filesystem::temp_directory_path() / "routebid_config_loader_test.yaml";
  {
    std::ofstream out(path);
    out << "server:\n  bind_address: \"0.0.0.0:7000\"\nscheduler:\n  sweep_interval: \"30s\"\n";
  }

  const auto config = ConfigLoader::LoadFromYaml(path.string());
  assert(config.server().bind_address() == "0.0.0.0:7000");
  assert(routebid::config::SweepInterval(config) == std::chrono::seconds(30));
  std::filesystem::remove(path);

  bool threw = false;
  try {
    ConfigLoader::LoadFromYaml(path.string());
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()).rfind("Failed to load YAML config:", 0) == 0;
  }
  assert(threw);
}

} // namespace

int main() {
  TestLoadsFullDocument();
  TestZeroValuesFallBackToDefaults();
  TestEmptyDocumentIsDefaultConfig();
  TestRejectsBadInput();
  TestLoadsFromFile();

  std::cout << "routebid_unit_config_loader: pass\n";
  return 0;
}
