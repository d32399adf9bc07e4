#include "orchestrator.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hostname.hpp"

namespace netcrawl::crawl {

using observability::IntField;
using observability::StringField;

Orchestrator::Orchestrator(std::shared_ptr<inventory::InventoryStore> store, std::shared_ptr<const session::FamilyRegistry> families,
                           connector::ConnectorFactory connector_factory, session::SessionOptions session_options,
                           session::NeighborPolicy policy, CrawlOptions options)
    : store_(std::move(store)),
      families_(std::move(families)),
      connector_factory_(std::move(connector_factory)),
      session_options_(session_options),
      policy_(std::move(policy)),
      options_(std::move(options)) {
  if (!store_ || !families_ || !connector_factory_) {
    throw util::ConfigError("orchestrator requires a store, a family registry and a connector factory");
  }
  if (options_.workers == 0) throw util::ConfigError("crawl.workers must be at least 1");

  const util::HostnameOptions normalize{policy_.KeepDomain()};
  seed_ = util::NormalizeHostname(options_.seed, normalize);
  if (seed_.empty()) throw util::ConfigError("seed device '" + options_.seed + "' is not a usable hostname");

  if (options_.family.empty()) options_.family = policy_.FamilyFor("");
  if (!families_->Contains(options_.family)) throw util::ConfigError("unknown device family '" + options_.family + "'");

  for (const auto& host : options_.include_only) include_only_.insert(util::NormalizeHostname(host, normalize));
  for (const auto& host : options_.exclude_hosts) exclude_hosts_.insert(util::NormalizeHostname(host, normalize));
}

Orchestrator::~Orchestrator() {
  RequestStop();
  for (auto& worker : workers_) {
    if (worker.joinable()) worker.join();
  }
}

void Orchestrator::RequestStop() {
  stop_requested_ = true;
  frontier_.Shutdown();
}

bool Orchestrator::Admit(const std::string& hostname) const {
  if (exclude_hosts_.contains(hostname)) return false;
  if (!include_only_.empty() && !include_only_.contains(hostname)) return false;
  return true;
}

void Orchestrator::RecordFatal(std::exception_ptr error) {
  {
    std::lock_guard lock(report_mutex_);
    if (!fatal_) fatal_ = error;
  }
  RequestStop();
}

CrawlReport Orchestrator::Run() {
  NETCRAWL_LOG_INFO("crawl starting", {StringField("seed", seed_), StringField("family", options_.family),
                                       IntField("workers", options_.workers)});

  store_->BeginRun();

  // the seed bypasses include/exclude filters
  if (store_->TryClaim(seed_)) {
    FrontierEntry seed{seed_, util::IsIPv4Literal(seed_) ? seed_ : std::string(), options_.family};
    frontier_.Push(seed);
  }

  for (std::size_t i = 0; i < options_.workers; ++i) {
    workers_.emplace_back(&Orchestrator::WorkerLoop, this, i);
  }

  const bool drained = frontier_.WaitIdle();
  frontier_.Shutdown();
  for (auto& worker : workers_) {
    if (worker.joinable()) worker.join();
  }
  workers_.clear();

  {
    std::lock_guard lock(report_mutex_);
    if (fatal_) std::rethrow_exception(fatal_);
  }

  CrawlReport report;
  report.visited        = visited_;
  report.crawled        = crawled_;
  report.errored        = errored_;
  report.duplicates     = duplicates_;
  report.skipped        = skipped_;
  report.inventory_only = inventory_only_;
  report.incomplete     = store_->Status().incomplete;
  report.seed           = seed_;
  report.stopped        = stop_requested_ || !drained;
  {
    std::lock_guard lock(report_mutex_);
    report.seed_visited = seed_visited_;
    report.seed_failure = seed_failure_;
  }

  NETCRAWL_LOG_INFO("crawl finished", {IntField("visited", static_cast<int64_t>(report.visited)),
                                       IntField("crawled", static_cast<int64_t>(report.crawled)),
                                       IntField("errored", static_cast<int64_t>(report.errored)),
                                       IntField("incomplete", static_cast<int64_t>(report.incomplete.size())),
                                       observability::BoolField("stopped", report.stopped)});
  return report;
}

void Orchestrator::WorkerLoop(std::size_t index) {
  try {
    auto                   connector = connector_factory_();
    session::DeviceSession session(*connector, families_, session_options_, policy_);

    while (auto entry = frontier_.Pop()) {
      try {
        ProcessEntry(session, *entry);
      } catch (const util::StoreError&) {
        frontier_.Done();
        throw;
      } catch (const std::exception& e) {
        // anything the session does not classify still only costs this device
        NETCRAWL_LOG_ERROR("visit aborted", {StringField("host", entry->hostname), StringField("error", e.what())});
        store_->MarkErrored(entry->hostname, "InternalError", e.what());
        errored_++;
      }
      frontier_.Done();
    }
  } catch (const std::exception& e) {
    NETCRAWL_LOG_ERROR("crawl worker stopped", {IntField("worker", static_cast<int64_t>(index)), StringField("error", e.what())});
    RecordFatal(std::current_exception());
  }
}

void Orchestrator::ProcessEntry(session::DeviceSession& session, const FrontierEntry& entry) {
  visited_++;

  auto result = session.Visit(entry, options_.credentials);

  if (!result.Ok()) {
    store_->MarkErrored(entry.hostname, session::ToString(result.failure->kind), result.failure->message);
    errored_++;
    if (entry.hostname == seed_) {
      std::lock_guard lock(report_mutex_);
      seed_failure_ = std::string(session::ToString(result.failure->kind)) + ": " + result.failure->message;
    }
    return;
  }

  if (entry.hostname == seed_) {
    std::lock_guard lock(report_mutex_);
    seed_visited_ = true;
  }

  const auto& record = result.record;

  // reached under another name (seed given as an IP, CDP name with a different domain)
  if (record.hostname != entry.hostname && !store_->TryClaim(record.hostname)) {
    NETCRAWL_LOG_INFO("duplicate visit", {StringField("host", entry.hostname), StringField("identified", record.hostname)});
    store_->MarkCrawled(entry.hostname);
    duplicates_++;
    return;
  }

  store_->Upsert(record);
  store_->MarkCrawled(record.hostname);
  if (record.hostname != entry.hostname) store_->MarkCrawled(entry.hostname);
  crawled_++;

  skipped_ += result.skipped_neighbors;
  for (const auto& neighbor : result.neighbors) {
    HandleNeighbor(neighbor);
  }
}

void Orchestrator::HandleNeighbor(const session::DiscoveredNeighbor& neighbor) {
  store_->RecordEdge(neighbor.edge);

  const auto& hostname = neighbor.entry.hostname;
  if (!Admit(hostname)) {
    NETCRAWL_LOG_DEBUG("neighbor filtered", {StringField("host", hostname)});
    skipped_++;
    return;
  }

  if (neighbor.disposition == session::NeighborDisposition::kInventoryOnly) {
    if (neighbor.inventory_record && store_->TryClaim(hostname)) {
      store_->Upsert(*neighbor.inventory_record);
      store_->MarkCrawled(hostname);
      inventory_only_++;
    }
    return;
  }

  // a lost claim means someone else already owns the hostname
  if (stop_requested_ || !store_->TryClaim(hostname)) return;

  if (!families_->Contains(neighbor.entry.family)) {
    store_->MarkErrored(hostname, "ConfigError", "unknown device family '" + neighbor.entry.family + "'");
    errored_++;
    return;
  }
  frontier_.Push(neighbor.entry);
}

} // namespace netcrawl::crawl
