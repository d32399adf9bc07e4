#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/model/claim_record.hpp"
#include "internal/db/model/device_record.hpp"
#include "internal/db/model/neighbor_edge_record.hpp"

namespace netcrawl::inventory {

struct StatusSummary {
  std::size_t claimed = 0;
  std::size_t crawled = 0;
  std::size_t errored = 0;

  std::size_t devices = 0;
  std::size_t edges   = 0;

  // (hostname, reason)
  std::vector<std::pair<std::string, std::string>> errors;

  // still claimed: in flight, or abandoned by an interrupted run
  std::vector<std::string> incomplete;
};

/*
  InventoryStore

  Claims, device records and adjacency for one crawl, over a db::Repository.

  Every operation runs in its own transaction and the store serializes them,
  so TryClaim is linearizable on every backend: of N concurrent claimers of
  one hostname exactly one sees true.

  Repository failures surface as util::StoreError.
*/
class InventoryStore {
 public:
  explicit InventoryStore(std::shared_ptr<db::Repository> repository);

  // unseen -> claimed; false when the hostname already has a claim
  bool TryClaim(const std::string& hostname);

  void Upsert(const db::model::DeviceRecord& record);

  void MarkCrawled(const std::string& hostname);

  // `kind` is the error class name, e.g. "ConnectionError"
  void MarkErrored(const std::string& hostname, const std::string& kind, const std::string& reason);

  void RecordEdge(const db::model::NeighborEdgeRecord& edge);

  db::model::ClaimStatus ClaimStatusOf(const std::string& hostname);

  StatusSummary Status();

  // sorted by hostname
  std::vector<db::model::DeviceRecord> ExportAll();

  std::vector<db::model::NeighborEdgeRecord> Edges();

  // Forget claims from a previous run; devices and edges are kept.
  void BeginRun();

  // Delete everything.
  void Reset();

 private:
  void SetTerminal(const std::string& hostname, db::model::ClaimStatus status, const std::string& reason);

  std::shared_ptr<db::Repository> repository_;
  std::mutex                      mutex_;
};

// Device CSV: header plus one row per device, sorted by hostname.
void WriteDevicesCsv(std::ostream& out, const std::vector<db::model::DeviceRecord>& devices);

void WriteEdgesCsv(std::ostream& out, const std::vector<db::model::NeighborEdgeRecord>& edges);

// Opens `path` for writing; throws util::StoreError when it cannot.
void ExportCsvFiles(InventoryStore& store, const std::string& devices_path, const std::string& edges_path);

} // namespace netcrawl::inventory
