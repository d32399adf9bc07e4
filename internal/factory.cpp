#include "factory.hpp"

#include <cstdlib>
#include <memory>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/connector/exec_connector.hpp"
#include "internal/connector/replay_connector.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#if NETCRAWL_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace netcrawl::factory {

using netcrawl::runtime::config::RuntimeConfig;

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if NETCRAWL_DB_SQLITE
    db::sqlite::SqliteOptions options;
    options.busy_timeout = util::FromProto(database.sqlite().busy_timeout(), options.busy_timeout);

    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), options);
    db::sqlite::BootstrapSchema(*sqlite_db);
    NETCRAWL_LOG_INFO("inventory database opened", {observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw util::ConfigError("sqlite backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

std::shared_ptr<inventory::InventoryStore> BuildStore(const RuntimeConfig& config) {
  return std::make_shared<inventory::InventoryStore>(BuildRepository(config));
}

connector::ConnectorFactory BuildConnectorFactory(const RuntimeConfig& config) {
  const auto& backend = config.connector();

  if (backend.has_replay()) {
    const auto capture_dir = backend.replay().capture_dir();
    return [capture_dir] { return std::make_unique<connector::ReplayConnector>(capture_dir); };
  }

  connector::ExecConnectorOptions options;
  options.command_template = backend.exec().command_template();
  options.probe_command    = backend.exec().probe_command();

  // the remote-shell client reads the password from the environment; set once, before any worker starts
  const auto password = netcrawl::config::ResolvePassword(config);
  if (!password.empty()) {
    const char* inherited = std::getenv("SSHPASS");
    if (inherited && password != inherited) {
      NETCRAWL_LOG_WARN("replacing inherited SSHPASS with the configured password", {});
    }
    if (setenv("SSHPASS", password.c_str(), 1) != 0) {
      throw util::ConfigError("cannot export SSHPASS for the exec connector");
    }
  }

  return [options] { return std::make_unique<connector::ExecConnector>(options); };
}

session::SessionOptions BuildSessionOptions(const RuntimeConfig& config) {
  const auto& s = config.session();

  session::SessionOptions options;
  options.connect_timeout = util::FromProto(s.connect_timeout(), options.connect_timeout);
  options.command_timeout = util::FromProto(s.command_timeout(), options.command_timeout);
  options.retry_backoff   = util::FromProto(s.retry_backoff(), options.retry_backoff);
  options.command_retries = s.command_retries();
  return options;
}

crawl::CrawlOptions BuildCrawlOptions(const RuntimeConfig& config) {
  const auto& c = config.crawl();

  crawl::CrawlOptions options;
  options.seed    = c.seed_device();
  options.family  = c.default_family();
  options.workers = c.workers();
  options.include_only.assign(c.include_only().begin(), c.include_only().end());
  options.exclude_hosts.assign(c.exclude_hosts().begin(), c.exclude_hosts().end());
  options.credentials.username = config.credentials().username();
  options.credentials.password = netcrawl::config::ResolvePassword(config);
  return options;
}

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Persistence
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);
  app.store      = std::make_shared<inventory::InventoryStore>(app.repository);

  // ------------------------------------------------------------------
  // Device families / templates
  // ------------------------------------------------------------------
  app.families = session::FamilyRegistry::Load(config.templates());
  if (!app.families->Contains(config.crawl().default_family())) {
    throw util::ConfigError("unknown default family '" + config.crawl().default_family() + "'");
  }
  for (const auto& entry : config.crawl().family_overrides()) {
    if (!app.families->Contains(entry.family())) {
      throw util::ConfigError("family override '" + entry.platform_pattern() + "' names unknown family '" + entry.family() + "'");
    }
  }

  // ------------------------------------------------------------------
  // Sessions
  // ------------------------------------------------------------------
  app.connector_factory = BuildConnectorFactory(config);
  app.session_options   = BuildSessionOptions(config);
  app.policy            = session::NeighborPolicy(config.crawl());

  return app;
}

std::unique_ptr<crawl::Orchestrator> BuildOrchestrator(const Application& app, const RuntimeConfig& config) {
  return std::make_unique<crawl::Orchestrator>(app.store, app.families, app.connector_factory, app.session_options, app.policy,
                                               BuildCrawlOptions(config));
}

} // namespace netcrawl::factory
