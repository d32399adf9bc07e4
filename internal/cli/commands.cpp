#include "commands.hpp"

#include <google/protobuf/util/json_util.h>

#include <chrono>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/inventory/inventory_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace netcrawl::cli {

using netcrawl::runtime::config::RuntimeConfig;

namespace {

std::string RequireValue(const std::vector<std::string>& args, std::size_t& i) {
  if (i + 1 >= args.size()) throw util::ConfigError("missing value for " + args[i]);
  return args[++i];
}

uint32_t ParseWorkers(const std::string& value) {
  std::size_t consumed = 0;
  long        parsed   = 0;
  try {
    parsed = std::stol(value, &consumed);
  } catch (const std::exception&) {
    throw util::ConfigError("--workers expects a positive integer, got '" + value + "'");
  }
  if (consumed != value.size() || parsed <= 0 || parsed > 1024) {
    throw util::ConfigError("--workers expects a positive integer, got '" + value + "'");
  }
  return static_cast<uint32_t>(parsed);
}

bool IsCommand(const std::string& value) {
  return value == "crawl" || value == "status" || value == "show-config" || value == "export" || value == "reset";
}

// Polls the interrupt flag and turns it into RequestStop(); joined on scope exit.
class InterruptWatcher {
 public:
  InterruptWatcher(const std::atomic<bool>& interrupted, crawl::Orchestrator& orchestrator)
      : thread_([this, &interrupted, &orchestrator] {
          while (!done_) {
            if (interrupted) {
              NETCRAWL_LOG_WARN("interrupt received, stopping crawl");
              orchestrator.RequestStop();
              return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
          }
        }) {
  }

  ~InterruptWatcher() {
    done_ = true;
    if (thread_.joinable()) thread_.join();
  }

 private:
  std::atomic<bool> done_{false};
  std::thread       thread_;
};

} // namespace

void PrintUsage(std::ostream& out) {
  out << "Usage:\n"
      << "  netcrawl [--config <config.yaml>] crawl [--seed <host>] [--workers <n>] [--family <name>] [--username <user>]\n"
      << "                                          [--devices-csv <path>] [--edges-csv <path>]\n"
      << "  netcrawl [--config <config.yaml>] status\n"
      << "  netcrawl [--config <config.yaml>] show-config\n"
      << "  netcrawl [--config <config.yaml>] export [--devices-csv <path>] [--edges-csv <path>]\n"
      << "  netcrawl [--config <config.yaml>] reset\n";
}

CliOptions ParseArgs(const std::vector<std::string>& args) {
  CliOptions options;

  for (std::size_t i = 0; i < args.size(); ++i) {
    const auto& arg = args[i];

    if (arg == "-h" || arg == "--help") {
      options.help = true;
    } else if (arg == "--config") {
      options.config_path = RequireValue(args, i);
    } else if (arg == "--seed") {
      options.seed = RequireValue(args, i);
    } else if (arg == "--family") {
      options.family = RequireValue(args, i);
    } else if (arg == "--username") {
      options.username = RequireValue(args, i);
    } else if (arg == "--workers") {
      options.workers = ParseWorkers(RequireValue(args, i));
    } else if (arg == "--devices-csv") {
      options.devices_csv = RequireValue(args, i);
    } else if (arg == "--edges-csv") {
      options.edges_csv = RequireValue(args, i);
    } else if (IsCommand(arg) && options.command.empty()) {
      options.command = arg;
    } else {
      throw util::ConfigError("unexpected argument '" + arg + "'");
    }
  }

  if (options.command.empty() && !options.help) throw util::ConfigError("no command given");

  const bool crawl_flags = options.seed || options.family || options.username || options.workers;
  if (crawl_flags && options.command != "crawl") {
    throw util::ConfigError("--seed, --workers, --family and --username only apply to crawl");
  }
  const bool csv_flags = options.devices_csv || options.edges_csv;
  if (csv_flags && options.command != "crawl" && options.command != "export") {
    throw util::ConfigError("--devices-csv and --edges-csv only apply to crawl and export");
  }

  return options;
}

void ApplyOverrides(const CliOptions& options, RuntimeConfig& config) {
  auto* crawl = config.mutable_crawl();
  if (options.seed) crawl->set_seed_device(*options.seed);
  if (options.family) crawl->set_default_family(*options.family);
  if (options.workers) crawl->set_workers(*options.workers);
  if (options.username) config.mutable_credentials()->set_username(*options.username);
  if (options.devices_csv) config.mutable_output()->set_devices_csv(*options.devices_csv);
  if (options.edges_csv) config.mutable_output()->set_edges_csv(*options.edges_csv);
}

int Run(const CliOptions& options, const std::atomic<bool>& interrupted, std::ostream& out, std::ostream& err) {
  if (options.help) {
    PrintUsage(out);
    return kExitOk;
  }

  RuntimeConfig config;
  try {
    config = config::ConfigLoader::LoadFromYaml(options.config_path);
    ApplyOverrides(options, config);
    config::ApplyDefaults(config);
    if (options.command == "crawl") config::ValidateConfig(config);
  } catch (const util::ConfigError& e) {
    err << "configuration error: " << e.what() << "\n";
    return kExitUsage;
  }

  observability::InitializeLogging(config);

  int code = kExitOk;
  try {
    if (options.command == "crawl") {
      code = RunCrawl(config, interrupted, out);
    } else if (options.command == "status") {
      code = RunStatus(config, out);
    } else if (options.command == "show-config") {
      code = RunShowConfig(config, out);
    } else if (options.command == "export") {
      code = RunExport(config, out);
    } else if (options.command == "reset") {
      code = RunReset(config, out);
    }
  } catch (const util::ConfigError& e) {
    NETCRAWL_LOG_ERROR("configuration error", {observability::StringField("error", e.what())});
    err << "configuration error: " << e.what() << "\n";
    code = kExitUsage;
  } catch (const util::TemplateError& e) {
    NETCRAWL_LOG_ERROR("template error", {observability::StringField("error", e.what())});
    err << "template error: " << e.what() << "\n";
    code = kExitUsage;
  } catch (const std::exception& e) {
    NETCRAWL_LOG_ERROR("fatal error", {observability::StringField("error", e.what())});
    err << "error: " << e.what() << "\n";
    code = kExitCrawlFailed;
  }

  return code;
}

int RunCrawl(const RuntimeConfig& config, const std::atomic<bool>& interrupted, std::ostream& out) {
  auto app          = factory::Build(config);
  auto orchestrator = factory::BuildOrchestrator(app, config);

  crawl::CrawlReport report;
  {
    InterruptWatcher watcher(interrupted, *orchestrator);
    report = orchestrator->Run();
  }

  out << "visited " << report.visited << ", crawled " << report.crawled << ", errored " << report.errored << ", duplicates "
      << report.duplicates << ", skipped " << report.skipped << ", inventory-only " << report.inventory_only << "\n";

  if (report.stopped || interrupted) {
    out << "interrupted; " << report.incomplete.size() << " device(s) left incomplete\n";
    for (const auto& host : report.incomplete) out << "  " << host << "\n";
    return kExitInterrupted;
  }

  if (!report.seed_visited) {
    out << "seed " << report.seed << " could not be visited: " << report.seed_failure << "\n";
    return kExitCrawlFailed;
  }

  inventory::ExportCsvFiles(*app.store, config.output().devices_csv(), config.output().edges_csv());
  out << "devices written to " << config.output().devices_csv() << "\n";
  out << "edges written to " << config.output().edges_csv() << "\n";
  return kExitOk;
}

int RunStatus(const RuntimeConfig& config, std::ostream& out) {
  auto store   = factory::BuildStore(config);
  auto summary = store->Status();

  out << "devices     " << summary.devices << "\n"
      << "edges       " << summary.edges << "\n"
      << "crawled     " << summary.crawled << "\n"
      << "errored     " << summary.errored << "\n"
      << "incomplete  " << summary.claimed << "\n";

  for (const auto& [host, reason] : summary.errors) out << "  error  " << host << "  " << reason << "\n";
  for (const auto& host : summary.incomplete) out << "  claimed " << host << "\n";
  return kExitOk;
}

int RunShowConfig(const RuntimeConfig& config, std::ostream& out) {
  auto redacted = config;
  if (!redacted.credentials().password().empty()) redacted.mutable_credentials()->set_password("<redacted>");

  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(redacted, &json, options);
  if (!status.ok()) {
    throw util::ConfigError("cannot render configuration: " + std::string(status.message()));
  }
  out << json;
  return kExitOk;
}

int RunExport(const RuntimeConfig& config, std::ostream& out) {
  auto store = factory::BuildStore(config);
  inventory::ExportCsvFiles(*store, config.output().devices_csv(), config.output().edges_csv());
  out << "devices written to " << config.output().devices_csv() << "\n";
  out << "edges written to " << config.output().edges_csv() << "\n";
  return kExitOk;
}

int RunReset(const RuntimeConfig& config, std::ostream& out) {
  auto store = factory::BuildStore(config);
  store->Reset();
  out << "inventory cleared\n";
  return kExitOk;
}

} // namespace netcrawl::cli
