#pragma once

#include <atomic>
#include <cstddef>
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

#include "frontier.hpp"
#include "internal/connector/connector.hpp"
#include "internal/inventory/inventory_store.hpp"
#include "internal/session/device_family.hpp"
#include "internal/session/device_session.hpp"
#include "internal/session/neighbor_policy.hpp"

namespace netcrawl::crawl {

struct CrawlOptions {
  std::string seed;
  std::string family; // empty: policy default
  uint32_t    workers = 4;

  // matched against normalized hostnames
  std::vector<std::string> include_only;
  std::vector<std::string> exclude_hosts;

  connector::Credentials credentials;
};

struct CrawlReport {
  std::size_t visited        = 0;
  std::size_t crawled        = 0;
  std::size_t errored        = 0;
  std::size_t duplicates     = 0; // identified as an already-claimed hostname
  std::size_t skipped        = 0; // filtered neighbors and skipped platforms
  std::size_t inventory_only = 0;

  // claimed but never finished (interrupted run)
  std::vector<std::string> incomplete;

  std::string seed;
  bool        seed_visited = false;
  std::string seed_failure;

  bool stopped = false;
};

/*
  Orchestrator

  Breadth-first crawl from a seed across CDP adjacency:

    claim -> enqueue -> worker pops -> visit -> record -> claim neighbors

  Every enqueue is preceded by a successful InventoryStore::TryClaim, so each
  hostname is visited at most once per run no matter how many neighbors
  report it. Each worker owns its own Connector and DeviceSession.

  Device failures are recorded and the crawl goes on; store failures stop
  the crawl and are rethrown from Run().
*/
class Orchestrator {
 public:
  Orchestrator(std::shared_ptr<inventory::InventoryStore> store, std::shared_ptr<const session::FamilyRegistry> families,
               connector::ConnectorFactory connector_factory, session::SessionOptions session_options, session::NeighborPolicy policy,
               CrawlOptions options);
  ~Orchestrator();

  Orchestrator(const Orchestrator&)            = delete;
  Orchestrator& operator=(const Orchestrator&) = delete;

  // Blocks until the frontier is exhausted or RequestStop().
  CrawlReport Run();

  // Workers finish the visit in hand and exit without draining the queue.
  void RequestStop();

  bool StopRequested() const { return stop_requested_; }

 private:
  void WorkerLoop(std::size_t index);
  void ProcessEntry(session::DeviceSession& session, const FrontierEntry& entry);
  void HandleNeighbor(const session::DiscoveredNeighbor& neighbor);
  void RecordFatal(std::exception_ptr error);

  bool Admit(const std::string& hostname) const;

  std::shared_ptr<inventory::InventoryStore>     store_;
  std::shared_ptr<const session::FamilyRegistry> families_;
  connector::ConnectorFactory                    connector_factory_;
  session::SessionOptions                        session_options_;
  session::NeighborPolicy                        policy_;
  CrawlOptions                                   options_;

  std::unordered_set<std::string> include_only_;
  std::unordered_set<std::string> exclude_hosts_;

  std::string seed_;

  Frontier                 frontier_;
  std::vector<std::thread> workers_;
  std::atomic<bool>        stop_requested_{false};

  std::atomic<std::size_t> visited_{0};
  std::atomic<std::size_t> crawled_{0};
  std::atomic<std::size_t> errored_{0};
  std::atomic<std::size_t> duplicates_{0};
  std::atomic<std::size_t> skipped_{0};
  std::atomic<std::size_t> inventory_only_{0};

  std::mutex         report_mutex_;
  bool               seed_visited_ = false;
  std::string        seed_failure_;
  std::exception_ptr fatal_;
};

} // namespace netcrawl::crawl
