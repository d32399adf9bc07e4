#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/claim_record.hpp"
#include "internal/db/model/device_record.hpp"
#include "internal/db/model/neighbor_edge_record.hpp"

namespace netcrawl::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - InsertClaim fails with AlreadyExists when the hostname has any claim row;
    this is what makes claims exclusive

  The DB is the source of truth for:
    crawl membership (claims)
    device inventory
    neighbor adjacency
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Claims
  // ---------------------------------------------------------------------

  virtual Result InsertClaim(Transaction&, const model::ClaimRecord&) = 0;

  virtual std::optional<model::ClaimRecord> GetClaim(Transaction&, const std::string& hostname) = 0;

  virtual Result UpdateClaim(Transaction&, const model::ClaimRecord&) = 0;

  virtual std::vector<model::ClaimRecord> ListClaims(Transaction&) = 0;

  virtual Result DeleteAllClaims(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Devices
  // ---------------------------------------------------------------------

  virtual Result UpsertDevice(Transaction&, const model::DeviceRecord&) = 0;

  virtual std::optional<model::DeviceRecord> GetDevice(Transaction&, const std::string& hostname) = 0;

  // Ordered by hostname.
  virtual std::vector<model::DeviceRecord> ListDevices(Transaction&) = 0;

  virtual Result DeleteAllDevices(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Neighbor edges
  // ---------------------------------------------------------------------

  virtual Result UpsertEdge(Transaction&, const model::NeighborEdgeRecord&) = 0;

  // Ordered by (from_hostname, to_hostname, local_interface).
  virtual std::vector<model::NeighborEdgeRecord> ListEdges(Transaction&) = 0;

  virtual Result DeleteAllEdges(Transaction&) = 0;
};

} // namespace netcrawl::db
