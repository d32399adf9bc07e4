#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/crawl/orchestrator.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/inventory/inventory_store.hpp"
#include "internal/session/device_family.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "tests/support/fake_network.hpp"

namespace {

using netcrawl::crawl::CrawlOptions;
using netcrawl::crawl::CrawlReport;
using netcrawl::crawl::Orchestrator;
using netcrawl::db::model::ClaimStatus;
using netcrawl::inventory::InventoryStore;
using netcrawl::session::FamilyRegistry;
using netcrawl::session::NeighborPolicy;
using netcrawl::session::SessionOptions;
using netcrawl::testing::FakeConnector;
using netcrawl::testing::FakeDevice;
using netcrawl::testing::FakeNetwork;

const std::vector<std::string> kRing = {"A", "B", "C", "D", "E"};

std::shared_ptr<const FamilyRegistry> Families() {
  static const auto families = FamilyRegistry::Load(netcrawl::runtime::config::TemplatesConfig{});
  return families;
}

// A - B - C - D - E - A, uplink on Gi1/0/1, downlink on Gi1/0/2
void BuildRing(FakeNetwork& network, const std::string& unreachable = "") {
  for (std::size_t i = 0; i < kRing.size(); ++i) {
    FakeDevice device;
    device.hostname    = kRing[i];
    device.ip          = "10.0.0." + std::to_string(i + 1);
    device.unreachable = kRing[i] == unreachable;
    network.AddDevice(device);
  }
  for (std::size_t i = 0; i < kRing.size(); ++i) {
    network.Link(kRing[i], "GigabitEthernet1/0/1", kRing[(i + 1) % kRing.size()], "GigabitEthernet1/0/2");
  }
}

std::shared_ptr<InventoryStore> MakeStore() {
  return std::make_shared<InventoryStore>(std::make_shared<netcrawl::db::memory::MemoryRepository>());
}

CrawlOptions Options(const std::string& seed, uint32_t workers = 4) {
  CrawlOptions options;
  options.seed        = seed;
  options.workers     = workers;
  options.credentials = {"netops", "secret"};
  return options;
}

SessionOptions FastSession() {
  SessionOptions options;
  options.retry_backoff = std::chrono::milliseconds(1);
  return options;
}

CrawlReport Crawl(FakeNetwork& network, const std::shared_ptr<InventoryStore>& store, CrawlOptions options,
                  NeighborPolicy policy = NeighborPolicy()) {
  Orchestrator orchestrator(
      store, Families(), [&network] { return std::make_unique<FakeConnector>(network); }, FastSession(), std::move(policy),
      std::move(options));
  return orchestrator.Run();
}

std::size_t CountLines(const std::string& path) {
  std::ifstream in(path);
  std::string   line;
  std::size_t   lines = 0;
  while (std::getline(in, line)) lines++;
  return lines;
}

void TestRingVisitsEachDeviceOnce() {
  FakeNetwork network;
  BuildRing(network);
  auto store = MakeStore();

  const auto report = Crawl(network, store, Options("a"));
  assert(report.seed_visited);
  assert(!report.stopped);
  assert(report.visited == 5);
  assert(report.crawled == 5);
  assert(report.errored == 0);
  assert(report.incomplete.empty());

  for (const auto& host : kRing) assert(network.Opens(host) == 1);
  assert(network.TotalOpens() == 5);
  assert(network.Closes() == 5);

  const auto devices = store->ExportAll();
  assert(devices.size() == 5);
  assert(devices[0].hostname == "a");
  assert(devices[0].mgmt_ip.empty() || devices[0].mgmt_ip == "10.0.0.1");
  assert(devices[1].hostname == "b");
  assert(devices[1].mgmt_ip == "10.0.0.2");
  assert(devices[4].serial_numbers == std::vector<std::string>{"FOCE0001"});

  // every device reports both ring neighbors
  assert(store->Edges().size() == 10);

  const auto dir = std::filesystem::temp_directory_path() / "netcrawl_crawl_ring_test";
  std::filesystem::create_directories(dir);
  const auto devices_csv = (dir / "devices.csv").string();
  const auto edges_csv   = (dir / "edges.csv").string();
  netcrawl::inventory::ExportCsvFiles(*store, devices_csv, edges_csv);
  assert(CountLines(devices_csv) == 6);
  assert(CountLines(edges_csv) == 11);
  std::filesystem::remove_all(dir);
}

void TestUnreachableDeviceDoesNotStopCrawl() {
  FakeNetwork network;
  BuildRing(network, "C");
  auto store = MakeStore();

  const auto report = Crawl(network, store, Options("a"));
  assert(report.seed_visited);
  assert(report.visited == 5);
  assert(report.crawled == 4);
  assert(report.errored == 1);

  assert(store->ClaimStatusOf("c") == ClaimStatus::kErrored);
  const auto status = store->Status();
  assert(status.errors.size() == 1);
  assert(status.errors[0].first == "c");
  assert(status.errors[0].second.rfind("ConnectionError: unreachable as c and 10.0.0.3", 0) == 0);

  // D is still reached through E
  assert(network.Opens("d") == 1);
  assert(store->ExportAll().size() == 4);
}

void TestRecrawlIsIdempotent() {
  FakeNetwork network;
  BuildRing(network);
  auto store = MakeStore();

  Crawl(network, store, Options("a"));
  const auto first_devices = store->ExportAll();
  const auto first_edges   = store->Edges();

  // second run over existing inventory updates in place
  const auto again = Crawl(network, store, Options("a"));
  assert(again.crawled == 5);
  assert(store->ExportAll().size() == 5);
  assert(store->Edges().size() == first_edges.size());

  store->Reset();
  assert(store->ExportAll().empty());

  const auto fresh = Crawl(network, store, Options("a", 1));
  assert(fresh.crawled == 5);

  const auto devices = store->ExportAll();
  assert(devices.size() == first_devices.size());
  for (std::size_t i = 0; i < devices.size(); ++i) {
    assert(devices[i].hostname == first_devices[i].hostname);
    assert(devices[i].mgmt_ip == first_devices[i].mgmt_ip);
    assert(devices[i].serial_numbers == first_devices[i].serial_numbers);
    assert(devices[i].platform == first_devices[i].platform);
    assert(devices[i].software_version == first_devices[i].software_version);
  }

  const auto edges = store->Edges();
  assert(edges.size() == first_edges.size());
  for (std::size_t i = 0; i < edges.size(); ++i) {
    assert(edges[i].from_hostname == first_edges[i].from_hostname);
    assert(edges[i].to_hostname == first_edges[i].to_hostname);
    assert(edges[i].local_interface == first_edges[i].local_interface);
  }
}

void TestSeedByAddressIsNotVisitedTwice() {
  FakeNetwork network;
  BuildRing(network);
  auto store = MakeStore();

  const auto report = Crawl(network, store, Options("10.0.0.1"));
  assert(report.seed == "10.0.0.1");
  assert(report.seed_visited);
  assert(report.crawled == 5);
  assert(network.Opens("a") == 1);
  assert(network.TotalOpens() == 5);

  const auto devices = store->ExportAll();
  assert(devices.size() == 5);
  assert(devices[0].hostname == "a");
  assert(devices[0].mgmt_ip == "10.0.0.1");
}

void TestUnreachableSeed() {
  FakeNetwork network;
  BuildRing(network, "A");
  auto store = MakeStore();

  const auto report = Crawl(network, store, Options("a"));
  assert(!report.seed_visited);
  assert(report.seed_failure.rfind("ConnectionError", 0) == 0);
  assert(report.visited == 1);
  assert(network.TotalOpens() == 0);
}

void TestFiltersAndPlatformPolicy() {
  FakeNetwork network;
  BuildRing(network);
  network.AddDevice(FakeDevice{.hostname = "PHONE1", .ip = "10.0.9.1", .platform = "Cisco IP Phone 8845"});
  network.AddDevice(FakeDevice{.hostname = "AP1", .ip = "10.0.5.1", .platform = "cisco AIR-AP2802I-B-K9"});
  network.Link("B", "GigabitEthernet1/0/5", "PHONE1", "Port 1");
  network.Link("D", "GigabitEthernet1/0/10", "AP1", "GigabitEthernet0");

  auto store   = MakeStore();
  auto options = Options("a");
  options.exclude_hosts = {"C.lab.example.com"};

  const auto report = Crawl(network, store, options);
  assert(report.crawled == 4);
  assert(report.inventory_only == 1);
  assert(report.skipped >= 2); // c from both sides, plus the phone

  assert(network.Opens("c") == 0);
  assert(network.Opens("phone1") == 0);
  assert(network.Opens("ap1") == 0);

  assert(store->ClaimStatusOf("c") == ClaimStatus::kUnseen);
  assert(store->ClaimStatusOf("ap1") == ClaimStatus::kCrawled);

  const auto devices = store->ExportAll();
  assert(devices.size() == 5);
  bool saw_ap = false;
  for (const auto& d : devices) {
    assert(d.hostname != "phone1");
    if (d.hostname == "ap1") {
      saw_ap = true;
      assert(d.mgmt_ip == "10.0.5.1");
      assert(d.platform == std::vector<std::string>{"cisco AIR-AP2802I-B-K9"});
    }
  }
  assert(saw_ap);
}

void TestStopBeforeRunLeavesSeedIncomplete() {
  FakeNetwork network;
  BuildRing(network);
  auto store = MakeStore();

  Orchestrator orchestrator(
      store, Families(), [&network] { return std::make_unique<FakeConnector>(network); }, FastSession(), NeighborPolicy(), Options("a"));
  orchestrator.RequestStop();
  const auto report = orchestrator.Run();

  assert(report.stopped);
  assert(report.visited == 0);
  assert(report.incomplete == std::vector<std::string>{"a"});
  assert(network.TotalOpens() == 0);
}

// Delegates to a memory repository but fails every device write.
class BrokenDeviceTable final : public netcrawl::db::Repository {
 public:
  using Result      = netcrawl::db::Result;
  using Transaction = netcrawl::db::Transaction;

  std::unique_ptr<Transaction> Begin() override { return inner_.Begin(); }

  Result InsertClaim(Transaction& tx, const netcrawl::db::model::ClaimRecord& r) override { return inner_.InsertClaim(tx, r); }
  std::optional<netcrawl::db::model::ClaimRecord> GetClaim(Transaction& tx, const std::string& h) override { return inner_.GetClaim(tx, h); }
  Result UpdateClaim(Transaction& tx, const netcrawl::db::model::ClaimRecord& r) override { return inner_.UpdateClaim(tx, r); }
  std::vector<netcrawl::db::model::ClaimRecord> ListClaims(Transaction& tx) override { return inner_.ListClaims(tx); }
  Result DeleteAllClaims(Transaction& tx) override { return inner_.DeleteAllClaims(tx); }

  Result UpsertDevice(Transaction&, const netcrawl::db::model::DeviceRecord&) override {
    return Result::Err(netcrawl::db::ErrorCode::IOError, "disk full");
  }
  std::optional<netcrawl::db::model::DeviceRecord> GetDevice(Transaction& tx, const std::string& h) override { return inner_.GetDevice(tx, h); }
  std::vector<netcrawl::db::model::DeviceRecord> ListDevices(Transaction& tx) override { return inner_.ListDevices(tx); }
  Result DeleteAllDevices(Transaction& tx) override { return inner_.DeleteAllDevices(tx); }

  Result UpsertEdge(Transaction& tx, const netcrawl::db::model::NeighborEdgeRecord& e) override { return inner_.UpsertEdge(tx, e); }
  std::vector<netcrawl::db::model::NeighborEdgeRecord> ListEdges(Transaction& tx) override { return inner_.ListEdges(tx); }
  Result DeleteAllEdges(Transaction& tx) override { return inner_.DeleteAllEdges(tx); }

 private:
  netcrawl::db::memory::MemoryRepository inner_;
};

void TestStoreFailureIsFatal() {
  FakeNetwork network;
  BuildRing(network);
  auto store = std::make_shared<InventoryStore>(std::make_shared<BrokenDeviceTable>());

  bool threw = false;
  try {
    Crawl(network, store, Options("a"));
  } catch (const netcrawl::util::StoreError& e) {
    threw = std::string(e.what()).find("disk full") != std::string::npos;
  }
  assert(threw);
}

void TestRejectsBadOptions() {
  FakeNetwork network;
  auto        store   = MakeStore();
  auto        factory = [&network] { return std::make_unique<FakeConnector>(network); };

  bool threw = false;
  try {
    auto options   = Options("a");
    options.family = "juniper_junos";
    Orchestrator orchestrator(store, Families(), factory, FastSession(), NeighborPolicy(), options);
  } catch (const netcrawl::util::ConfigError&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    Orchestrator orchestrator(store, Families(), factory, FastSession(), NeighborPolicy(), Options("()"));
  } catch (const netcrawl::util::ConfigError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestRingVisitsEachDeviceOnce();
  TestUnreachableDeviceDoesNotStopCrawl();
  TestRecrawlIsIdempotent();
  TestSeedByAddressIsNotVisitedTwice();
  TestUnreachableSeed();
  TestFiltersAndPlatformPolicy();
  TestStopBeforeRunLeavesSeedIncomplete();
  TestStoreFailureIsFatal();
  TestRejectsBadOptions();

  std::cout << "netcrawl_integration_crawl_ring: pass\n";
  return 0;
}
