#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/connector/connector.hpp"
#include "internal/crawl/orchestrator.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/inventory/inventory_store.hpp"
#include "internal/session/device_family.hpp"
#include "internal/session/device_session.hpp"
#include "internal/session/neighbor_policy.hpp"

namespace netcrawl::factory {

/*
  Application

  Owns all long-lived objects used by one netcrawl invocation.
*/
struct Application {
  std::shared_ptr<db::Repository>           repository;
  std::shared_ptr<inventory::InventoryStore> store;

  std::shared_ptr<const session::FamilyRegistry> families;
  connector::ConnectorFactory                    connector_factory;
  session::SessionOptions                        session_options;
  session::NeighborPolicy                        policy;
};

/*
  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB and connector types.
*/
std::shared_ptr<db::Repository> BuildRepository(const netcrawl::runtime::config::RuntimeConfig& config);

std::shared_ptr<inventory::InventoryStore> BuildStore(const netcrawl::runtime::config::RuntimeConfig& config);

connector::ConnectorFactory BuildConnectorFactory(const netcrawl::runtime::config::RuntimeConfig& config);

session::SessionOptions BuildSessionOptions(const netcrawl::runtime::config::RuntimeConfig& config);

crawl::CrawlOptions BuildCrawlOptions(const netcrawl::runtime::config::RuntimeConfig& config);

// Store, templates, connectors. Expects a validated config.
Application Build(const netcrawl::runtime::config::RuntimeConfig& config);

std::unique_ptr<crawl::Orchestrator> BuildOrchestrator(const Application& app, const netcrawl::runtime::config::RuntimeConfig& config);

} // namespace netcrawl::factory
