#include "internal/config/config_loader.hpp"
#include "internal/util/errors.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

namespace {

using netcrawl::config::ApplyDefaults;
using netcrawl::config::ConfigLoader;
using netcrawl::config::ResolvePassword;
using netcrawl::config::ValidateConfig;
using netcrawl::runtime::config::RuntimeConfig;
using netcrawl::util::ConfigError;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "netcrawl_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

template <typename Fn>
bool ThrowsConfigError(Fn&& fn) {
  try {
    fn();
  } catch (const ConfigError&) {
    return true;
  }
  return false;
}

void TestLoadsFullConfig() {
  const auto path = WriteYaml("full", R"(crawl:
  seed_device: core-sw-01
  workers: 8
  default_family: cisco_nxos
  keep_domain: true
  include_only: ["site-"]
  exclude_hosts: [lab-sw-99]
  skip_platforms: ["IP Phone"]
  inventory_only_platforms: ["AIR-"]
  family_overrides:
    - platform_pattern: "^cisco N9K"
      family: cisco_nxos
credentials:
  username: netops
  password: "1234"
session:
  connect_timeout: 5s
  command_timeout: 1.5s
  command_retries: 3
  retry_backoff: 0.25s
connector:
  replay:
    capture_dir: /tmp/captures
database:
  sqlite:
    path: "C:\\inventory\\\"quoted\"\\db.sqlite"
templates:
  directory: /opt/netcrawl/templates
  families:
    cisco_asa:
      identify_command: show version
      neighbors_command: show cdp neighbors detail
      identify_template: asa_version.textfsm
      neighbors_template: asa_cdp.textfsm
output:
  devices_csv: out/devices.csv
  edges_csv: out/edges.csv
logging:
  level: debug
  file: /tmp/netcrawl.log
)");

  const auto config = ConfigLoader::LoadFromYaml(path.string());

  assert(config.crawl().seed_device() == "core-sw-01");
  assert(config.crawl().workers() == 8);
  assert(config.crawl().default_family() == "cisco_nxos");
  assert(config.crawl().keep_domain());
  assert(config.crawl().include_only_size() == 1 && config.crawl().include_only(0) == "site-");
  assert(config.crawl().exclude_hosts(0) == "lab-sw-99");
  assert(config.crawl().family_overrides_size() == 1);
  assert(config.crawl().family_overrides(0).family() == "cisco_nxos");

  // quoted numeric scalar stays a string
  assert(config.credentials().password() == "1234");

  assert(config.session().connect_timeout().seconds() == 5);
  assert(config.session().command_timeout().seconds() == 1);
  assert(config.session().command_timeout().nanos() == 500000000);
  assert(config.session().command_retries() == 3);
  assert(config.session().retry_backoff().nanos() == 250000000);

  assert(config.connector().has_replay());
  assert(config.connector().replay().capture_dir() == "/tmp/captures");
  assert(config.database().sqlite().path() == "C:\\inventory\\\"quoted\"\\db.sqlite");

  assert(config.templates().families().count("cisco_asa") == 1);
  assert(config.templates().families().at("cisco_asa").neighbors_template() == "asa_cdp.textfsm");

  assert(config.output().devices_csv() == "out/devices.csv");
  assert(config.logging().level() == "debug");

  ValidateConfig(config);
}

void TestEmptyDocumentIsEmptyConfig() {
  const auto config = ConfigLoader::LoadFromYamlString("");
  assert(config.crawl().seed_device().empty());
  assert(!config.has_connector());
}

void TestRejectsBadDocuments() {
  // unknown key
  assert(ThrowsConfigError([] { ConfigLoader::LoadFromYamlString("crawl:\n  seed: sw1\n"); }));
  // wrong type
  assert(ThrowsConfigError([] { ConfigLoader::LoadFromYamlString("crawl:\n  workers: many\n"); }));
  // root is not a mapping
  assert(ThrowsConfigError([] { ConfigLoader::LoadFromYamlString("- a\n- b\n"); }));
  // malformed YAML
  assert(ThrowsConfigError([] { ConfigLoader::LoadFromYamlString("crawl: [unterminated\n"); }));
  // missing file
  assert(ThrowsConfigError([] { ConfigLoader::LoadFromYaml("/nonexistent/netcrawl/config.yaml"); }));
}

void TestDefaults() {
  auto config = ConfigLoader::LoadFromYamlString("crawl:\n  seed_device: sw1\n");
  ApplyDefaults(config);

  assert(config.crawl().workers() == 4);
  assert(config.crawl().default_family() == "cisco_ios");
  assert(!config.crawl().keep_domain());
  assert(config.session().connect_timeout().seconds() == 20);
  assert(config.session().command_timeout().seconds() == 30);
  assert(config.session().retry_backoff().nanos() == 500000000);
  assert(config.connector().has_exec());
  assert(config.connector().exec().command_template().find("{command}") != std::string::npos);
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "network_devices.db");
  assert(config.output().devices_csv() == "network_inventory.csv");
  assert(config.output().edges_csv() == "network_edges.csv");
  assert(config.logging().level() == "info");

  // explicit values win
  auto memory = ConfigLoader::LoadFromYamlString("crawl:\n  workers: 2\ndatabase:\n  memory: {}\n");
  ApplyDefaults(memory);
  assert(memory.crawl().workers() == 2);
  assert(memory.database().has_memory());
}

void TestValidation() {
  auto base = ConfigLoader::LoadFromYamlString(R"(crawl:
  seed_device: sw1
credentials:
  username: admin
  password: secret
)");
  ApplyDefaults(base);
  ValidateConfig(base);

  {
    auto c = base;
    c.mutable_crawl()->clear_seed_device();
    assert(ThrowsConfigError([&] { ValidateConfig(c); }));
  }
  {
    auto c = base;
    c.mutable_credentials()->clear_username();
    assert(ThrowsConfigError([&] { ValidateConfig(c); }));
  }
  {
    auto c = base;
    c.mutable_credentials()->clear_password();
    assert(ThrowsConfigError([&] { ValidateConfig(c); }));
  }
  {
    auto c = base;
    c.mutable_crawl()->set_workers(0);
    assert(ThrowsConfigError([&] { ValidateConfig(c); }));
  }
  {
    auto  c     = base;
    auto* entry = c.mutable_crawl()->add_family_overrides();
    entry->set_platform_pattern("N9K(");
    entry->set_family("cisco_nxos");
    assert(ThrowsConfigError([&] { ValidateConfig(c); }));
  }
  {
    auto c = base;
    c.mutable_connector()->mutable_exec()->set_command_template("ssh {host}");
    assert(ThrowsConfigError([&] { ValidateConfig(c); }));
  }
  {
    auto c = base;
    c.mutable_connector()->mutable_replay()->clear_capture_dir();
    assert(ThrowsConfigError([&] { ValidateConfig(c); }));
  }
}

void TestPasswordFromEnvironment() {
  auto config = ConfigLoader::LoadFromYamlString(R"(crawl:
  seed_device: sw1
credentials:
  username: admin
  password_env: NETCRAWL_TEST_PASSWORD
)");
  ApplyDefaults(config);

  unsetenv("NETCRAWL_TEST_PASSWORD");
  assert(ResolvePassword(config).empty());
  assert(ThrowsConfigError([&] { ValidateConfig(config); }));

  setenv("NETCRAWL_TEST_PASSWORD", "from-env", 1);
  assert(ResolvePassword(config) == "from-env");
  ValidateConfig(config);

  // an inline password wins
  config.mutable_credentials()->set_password("inline");
  assert(ResolvePassword(config) == "inline");
  unsetenv("NETCRAWL_TEST_PASSWORD");
}

} // namespace

void TestSampleConfigLoads() {
  const auto path = std::filesystem::path(NETCRAWL_FIXTURE_DIR) / ".." / ".." / "configs" / "netcrawl.yaml";
  auto       config = ConfigLoader::LoadFromYaml(path.string());
  ApplyDefaults(config);

  assert(config.crawl().seed_device() == "core-01.example.com");
  assert(config.crawl().family_overrides_size() == 1);
  assert(config.crawl().family_overrides(0).family() == "cisco_nxos");
  assert(config.session().retry_backoff().nanos() == 500 * 1000 * 1000);
  assert(config.database().sqlite().busy_timeout().seconds() == 5);
  assert(config.logging().file() == "crawler.log");

  setenv("NETCRAWL_PASSWORD", "sample", 1);
  ValidateConfig(config);
  unsetenv("NETCRAWL_PASSWORD");
}

int main() {
  TestLoadsFullConfig();
  TestSampleConfigLoads();
  TestEmptyDocumentIsEmptyConfig();
  TestRejectsBadDocuments();
  TestDefaults();
  TestValidation();
  TestPasswordFromEnvironment();

  std::cout << "netcrawl_unit_config_loader: pass\n";
  return 0;
}
