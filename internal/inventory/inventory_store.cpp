#include "inventory_store.hpp"

#include <fstream>

#include "internal/observability/logging.hpp"
#include "internal/util/csv.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace netcrawl::inventory {

using db::model::ClaimRecord;
using db::model::ClaimStatus;

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  std::string message = context + ": " + db::ToString(result.code);
  if (!result.message.empty()) message += ": " + result.message;
  throw util::StoreError(message);
}

} // namespace

InventoryStore::InventoryStore(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
  if (!repository_) throw util::StoreError("inventory store requires a repository");
}

bool InventoryStore::TryClaim(const std::string& hostname) {
  std::lock_guard lock(mutex_);

  auto tx = repository_->Begin();
  if (repository_->GetClaim(*tx, hostname).has_value()) {
    return false;
  }

  ClaimRecord claim;
  claim.hostname      = hostname;
  claim.status        = ClaimStatus::kClaimed;
  claim.claimed_at_ms = util::NowMs();
  claim.updated_at_ms = claim.claimed_at_ms;

  const auto result = repository_->InsertClaim(*tx, claim);
  if (result.code == db::ErrorCode::AlreadyExists) {
    return false;
  }
  ThrowIfDbError(result, "claim " + hostname);
  tx->Commit();
  return true;
}

void InventoryStore::Upsert(const db::model::DeviceRecord& record) {
  std::lock_guard lock(mutex_);

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->UpsertDevice(*tx, record), "upsert device " + record.hostname);
  tx->Commit();
}

void InventoryStore::SetTerminal(const std::string& hostname, ClaimStatus status, const std::string& reason) {
  std::lock_guard lock(mutex_);

  auto tx    = repository_->Begin();
  auto claim = repository_->GetClaim(*tx, hostname);

  const auto now = util::NowMs();
  if (!claim.has_value()) {
    // marking an unclaimed host (e.g. a crawl resumed after Reset) records it anyway
    ClaimRecord fresh;
    fresh.hostname      = hostname;
    fresh.status        = status;
    fresh.reason        = reason;
    fresh.claimed_at_ms = now;
    fresh.updated_at_ms = now;
    ThrowIfDbError(repository_->InsertClaim(*tx, fresh), "mark " + hostname);
  } else {
    claim->status        = status;
    claim->reason        = reason;
    claim->updated_at_ms = now;
    ThrowIfDbError(repository_->UpdateClaim(*tx, *claim), "mark " + hostname);
  }

  if (status == ClaimStatus::kErrored) {
    if (auto device = repository_->GetDevice(*tx, hostname)) {
      device->crawl_status    = db::model::CrawlStatus::kError;
      device->crawl_error     = reason;
      device->last_crawled_ms = now;
      ThrowIfDbError(repository_->UpsertDevice(*tx, *device), "mark device " + hostname);
    }
  }

  tx->Commit();
}

void InventoryStore::MarkCrawled(const std::string& hostname) {
  SetTerminal(hostname, ClaimStatus::kCrawled, "");
}

void InventoryStore::MarkErrored(const std::string& hostname, const std::string& kind, const std::string& reason) {
  SetTerminal(hostname, ClaimStatus::kErrored, reason.empty() ? kind : kind + ": " + reason);
}

void InventoryStore::RecordEdge(const db::model::NeighborEdgeRecord& edge) {
  std::lock_guard lock(mutex_);

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->UpsertEdge(*tx, edge), "record edge " + edge.from_hostname + " -> " + edge.to_hostname);
  tx->Commit();
}

ClaimStatus InventoryStore::ClaimStatusOf(const std::string& hostname) {
  std::lock_guard lock(mutex_);

  auto tx    = repository_->Begin();
  auto claim = repository_->GetClaim(*tx, hostname);
  tx->Rollback();
  return claim.has_value() ? claim->status : ClaimStatus::kUnseen;
}

StatusSummary InventoryStore::Status() {
  std::lock_guard lock(mutex_);

  auto tx = repository_->Begin();

  StatusSummary summary;
  for (const auto& claim : repository_->ListClaims(*tx)) {
    switch (claim.status) {
      case ClaimStatus::kClaimed:
        summary.claimed++;
        summary.incomplete.push_back(claim.hostname);
        break;
      case ClaimStatus::kCrawled:
        summary.crawled++;
        break;
      case ClaimStatus::kErrored:
        summary.errored++;
        summary.errors.emplace_back(claim.hostname, claim.reason);
        break;
      case ClaimStatus::kUnseen:
        break;
    }
  }
  summary.devices = repository_->ListDevices(*tx).size();
  summary.edges   = repository_->ListEdges(*tx).size();

  tx->Rollback();
  return summary;
}

std::vector<db::model::DeviceRecord> InventoryStore::ExportAll() {
  std::lock_guard lock(mutex_);

  auto tx      = repository_->Begin();
  auto devices = repository_->ListDevices(*tx);
  tx->Rollback();
  return devices;
}

std::vector<db::model::NeighborEdgeRecord> InventoryStore::Edges() {
  std::lock_guard lock(mutex_);

  auto tx    = repository_->Begin();
  auto edges = repository_->ListEdges(*tx);
  tx->Rollback();
  return edges;
}

void InventoryStore::BeginRun() {
  std::lock_guard lock(mutex_);

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->DeleteAllClaims(*tx), "clear claims");
  tx->Commit();
}

void InventoryStore::Reset() {
  std::lock_guard lock(mutex_);

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->DeleteAllEdges(*tx), "reset edges");
  ThrowIfDbError(repository_->DeleteAllDevices(*tx), "reset devices");
  ThrowIfDbError(repository_->DeleteAllClaims(*tx), "reset claims");
  tx->Commit();

  NETCRAWL_LOG_INFO("inventory reset");
}

// ------------------------------------------------------------------
// CSV export
// ------------------------------------------------------------------

void WriteDevicesCsv(std::ostream& out, const std::vector<db::model::DeviceRecord>& devices) {
  util::WriteCsvRow(out, {"hostname", "mgmt_ip", "serial_numbers", "platform", "software_version", "rommon_version", "config_register",
                          "mac_address", "uptime", "last_crawled", "crawl_status", "crawl_error"});

  for (const auto& d : devices) {
    util::WriteCsvRow(out, {d.hostname, d.mgmt_ip, util::Join(d.serial_numbers, ";"), util::Join(d.platform, ";"), d.software_version,
                            d.rommon_version, d.config_register, d.mac_address, d.uptime, util::FormatIso8601(d.last_crawled_ms),
                            db::model::ToString(d.crawl_status), d.crawl_error});
  }
}

void WriteEdgesCsv(std::ostream& out, const std::vector<db::model::NeighborEdgeRecord>& edges) {
  util::WriteCsvRow(out, {"from_hostname", "to_hostname", "local_interface", "neighbor_interface", "platform", "discovered_at"});

  for (const auto& e : edges) {
    util::WriteCsvRow(out, {e.from_hostname, e.to_hostname, e.local_interface, e.neighbor_interface, e.platform,
                            util::FormatIso8601(e.discovered_at_ms)});
  }
}

void ExportCsvFiles(InventoryStore& store, const std::string& devices_path, const std::string& edges_path) {
  if (!devices_path.empty()) {
    std::ofstream out(devices_path, std::ios::trunc);
    if (!out) throw util::StoreError("cannot write " + devices_path);
    const auto devices = store.ExportAll();
    WriteDevicesCsv(out, devices);
    NETCRAWL_LOG_INFO("devices exported", {observability::StringField("path", devices_path),
                                           observability::IntField("rows", static_cast<int64_t>(devices.size()))});
  }

  if (!edges_path.empty()) {
    std::ofstream out(edges_path, std::ios::trunc);
    if (!out) throw util::StoreError("cannot write " + edges_path);
    const auto edges = store.Edges();
    WriteEdgesCsv(out, edges);
    NETCRAWL_LOG_INFO("edges exported", {observability::StringField("path", edges_path),
                                         observability::IntField("rows", static_cast<int64_t>(edges.size()))});
  }
}

} // namespace netcrawl::inventory
