#include <atomic>
#include <csignal>
#include <iostream>
#include <string>
#include <vector>

#include "internal/cli/commands.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

static std::atomic<bool> g_interrupted{false};

void HandleSignal(int) {
  g_interrupted = true;
}

int main(int argc, char** argv) {
  netcrawl::cli::CliOptions options;
  try {
    options = netcrawl::cli::ParseArgs(std::vector<std::string>(argv + 1, argv + argc));
  } catch (const netcrawl::util::ConfigError& e) {
    std::cerr << "netcrawl: " << e.what() << "\n";
    netcrawl::cli::PrintUsage(std::cerr);
    return netcrawl::cli::kExitUsage;
  }

  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);

  const int code = netcrawl::cli::Run(options, g_interrupted, std::cout, std::cerr);
  netcrawl::observability::ShutdownLogging();
  return code;
}
