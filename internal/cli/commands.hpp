#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "config/config.pb.h"

namespace netcrawl::cli {

constexpr int kExitOk          = 0;
constexpr int kExitUsage       = 1;
constexpr int kExitCrawlFailed = 2;
constexpr int kExitInterrupted = 130;

struct CliOptions {
  std::string command;
  std::string config_path = "config.yaml";
  bool        help        = false;

  // crawl overrides
  std::optional<std::string> seed;
  std::optional<std::string> family;
  std::optional<std::string> username;
  std::optional<uint32_t>    workers;

  // crawl / export
  std::optional<std::string> devices_csv;
  std::optional<std::string> edges_csv;
};

void PrintUsage(std::ostream& out);

// util::ConfigError on a malformed command line
CliOptions ParseArgs(const std::vector<std::string>& args);

void ApplyOverrides(const CliOptions& options, netcrawl::runtime::config::RuntimeConfig& config);

// Loads, validates and runs; returns the process exit code.
int Run(const CliOptions& options, const std::atomic<bool>& interrupted, std::ostream& out, std::ostream& err);

int RunCrawl(const netcrawl::runtime::config::RuntimeConfig& config, const std::atomic<bool>& interrupted, std::ostream& out);
int RunStatus(const netcrawl::runtime::config::RuntimeConfig& config, std::ostream& out);
int RunShowConfig(const netcrawl::runtime::config::RuntimeConfig& config, std::ostream& out);
int RunExport(const netcrawl::runtime::config::RuntimeConfig& config, std::ostream& out);
int RunReset(const netcrawl::runtime::config::RuntimeConfig& config, std::ostream& out);

} // namespace netcrawl::cli
