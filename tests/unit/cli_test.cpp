#include "internal/cli/commands.hpp"
#include "internal/factory.hpp"
#include "internal/util/errors.hpp"

#include <atomic>
#include <cassert>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

using netcrawl::cli::ApplyOverrides;
using netcrawl::cli::CliOptions;
using netcrawl::cli::ParseArgs;

bool Rejects(const std::vector<std::string>& args) {
  try {
    ParseArgs(args);
  } catch (const netcrawl::util::ConfigError&) {
    return true;
  }
  return false;
}

void TestParsesCrawlFlags() {
  const auto options = ParseArgs({"--config", "lab.yaml", "crawl", "--seed", "core-01", "--workers", "8", "--family", "cisco_nxos",
                                  "--username", "netops", "--devices-csv", "d.csv", "--edges-csv", "e.csv"});
  assert(options.command == "crawl");
  assert(options.config_path == "lab.yaml");
  assert(options.seed == "core-01");
  assert(options.workers == 8u);
  assert(options.family == "cisco_nxos");
  assert(options.username == "netops");
  assert(options.devices_csv == "d.csv");
  assert(options.edges_csv == "e.csv");
  assert(!options.help);
}

void TestDefaultsAndHelp() {
  const auto status = ParseArgs({"status"});
  assert(status.command == "status");
  assert(status.config_path == "config.yaml");
  assert(!status.seed && !status.workers);

  const auto help = ParseArgs({"--help"});
  assert(help.help);
  assert(help.command.empty());

  assert(ParseArgs({"export", "--devices-csv", "out.csv"}).devices_csv == "out.csv");
}

void TestRejectsMalformedCommandLines() {
  assert(Rejects({}));
  assert(Rejects({"frobnicate"}));
  assert(Rejects({"crawl", "status"}));
  assert(Rejects({"crawl", "--seed"}));
  assert(Rejects({"crawl", "--workers", "0"}));
  assert(Rejects({"crawl", "--workers", "four"}));
  assert(Rejects({"crawl", "--workers", "4x"}));
  assert(Rejects({"status", "--seed", "sw1"}));
  assert(Rejects({"reset", "--devices-csv", "x.csv"}));
}

void TestOverridesWinOverConfig() {
  netcrawl::runtime::config::RuntimeConfig config;
  config.mutable_crawl()->set_seed_device("from-file");
  config.mutable_crawl()->set_workers(2);
  config.mutable_credentials()->set_username("file-user");

  ApplyOverrides(ParseArgs({"crawl", "--seed", "from-cli", "--username", "cli-user"}), config);
  assert(config.crawl().seed_device() == "from-cli");
  assert(config.crawl().workers() == 2);
  assert(config.credentials().username() == "cli-user");
}

void TestShowConfigRedactsPassword() {
  const auto path = std::filesystem::temp_directory_path() / "netcrawl_cli_test_config.yaml";
  {
    std::ofstream out(path);
    out << "crawl:\n  seed_device: sw1\ncredentials:\n  username: admin\n  password: hunter2\ndatabase:\n  memory: {}\n";
  }

  CliOptions options = ParseArgs({"--config", path.string(), "show-config"});

  std::atomic<bool>  interrupted{false};
  std::ostringstream out, err;
  assert(netcrawl::cli::Run(options, interrupted, out, err) == netcrawl::cli::kExitOk);
  assert(out.str().find("hunter2") == std::string::npos);
  assert(out.str().find("<redacted>") != std::string::npos);
  assert(out.str().find("\"seed_device\": \"sw1\"") != std::string::npos);

  std::filesystem::remove(path);
}

void TestMissingConfigIsUsageError() {
  CliOptions options = ParseArgs({"--config", "/nonexistent/netcrawl.yaml", "status"});

  std::atomic<bool>  interrupted{false};
  std::ostringstream out, err;
  assert(netcrawl::cli::Run(options, interrupted, out, err) == netcrawl::cli::kExitUsage);
  assert(err.str().rfind("configuration error:", 0) == 0);
}

void TestCrawlRequiresCredentials() {
  const auto path = std::filesystem::temp_directory_path() / "netcrawl_cli_test_nocreds.yaml";
  {
    std::ofstream out(path);
    out << "crawl:\n  seed_device: sw1\ndatabase:\n  memory: {}\n";
  }

  std::atomic<bool>  interrupted{false};
  std::ostringstream out, err;
  assert(netcrawl::cli::Run(ParseArgs({"--config", path.string(), "crawl"}), interrupted, out, err) == netcrawl::cli::kExitUsage);
  assert(err.str().find("credentials.username") != std::string::npos);

  std::filesystem::remove(path);
}

void TestConfiguredPasswordReplacesInheritedSshpass() {
  assert(setenv("SSHPASS", "stale", 1) == 0);

  netcrawl::runtime::config::RuntimeConfig config;
  config.mutable_credentials()->set_username("netops");
  config.mutable_credentials()->set_password("fresh");
  config.mutable_connector()->mutable_exec()->set_command_template("ssh -l {username} {host} {command}");

  auto factory = netcrawl::factory::BuildConnectorFactory(config);
  assert(factory);
  const char* exported = std::getenv("SSHPASS");
  assert(exported != nullptr);
  assert(std::strcmp(exported, "fresh") == 0);

  unsetenv("SSHPASS");
}

} // namespace

int main() {
  TestParsesCrawlFlags();
  TestDefaultsAndHelp();
  TestRejectsMalformedCommandLines();
  TestOverridesWinOverConfig();
  TestShowConfigRedactsPassword();
  TestMissingConfigIsUsageError();
  TestCrawlRequiresCredentials();
  TestConfiguredPasswordReplacesInheritedSshpass();

  std::cout << "netcrawl_unit_cli: pass\n";
  return 0;
}
