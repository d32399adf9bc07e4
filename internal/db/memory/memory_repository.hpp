#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <tuple>

#include "internal/db/api/repository.hpp"

namespace netcrawl::db::memory {

class MemoryTransaction;

/*
  In-process backend for tests and dry runs. Nothing survives the process.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertClaim(Transaction&, const model::ClaimRecord&) override;
  std::optional<model::ClaimRecord> GetClaim(Transaction&, const std::string&) override;
  Result UpdateClaim(Transaction&, const model::ClaimRecord&) override;
  std::vector<model::ClaimRecord> ListClaims(Transaction&) override;
  Result DeleteAllClaims(Transaction&) override;

  Result UpsertDevice(Transaction&, const model::DeviceRecord&) override;
  std::optional<model::DeviceRecord> GetDevice(Transaction&, const std::string&) override;
  std::vector<model::DeviceRecord> ListDevices(Transaction&) override;
  Result DeleteAllDevices(Transaction&) override;

  Result UpsertEdge(Transaction&, const model::NeighborEdgeRecord&) override;
  std::vector<model::NeighborEdgeRecord> ListEdges(Transaction&) override;
  Result DeleteAllEdges(Transaction&) override;

private:
  friend class MemoryTransaction;

  using EdgeKey = std::tuple<std::string, std::string, std::string>;

  // ordered maps give hostname-sorted listings for free
  struct State {
    std::map<std::string, model::ClaimRecord>  claims;
    std::map<std::string, model::DeviceRecord> devices;
    std::map<EdgeKey, model::NeighborEdgeRecord> edges;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

}
