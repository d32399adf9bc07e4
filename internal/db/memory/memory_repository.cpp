#include "memory_repository.hpp"

#include "memory_tx.hpp"

namespace netcrawl::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Claims
// ------------------------------------------------------------------

Result MemoryRepository::InsertClaim(Transaction& t, const model::ClaimRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.claims.contains(r.hostname)) return Result::Err(ErrorCode::AlreadyExists);
  s.claims[r.hostname] = r;
  return Result::Ok();
}

std::optional<model::ClaimRecord> MemoryRepository::GetClaim(Transaction& t, const std::string& hostname) {
  const auto& s  = TX(t).View();
  auto        it = s.claims.find(hostname);
  if (it == s.claims.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateClaim(Transaction& t, const model::ClaimRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.claims.contains(r.hostname)) return Result::Err(ErrorCode::NotFound, r.hostname);
  s.claims[r.hostname] = r;
  return Result::Ok();
}

std::vector<model::ClaimRecord> MemoryRepository::ListClaims(Transaction& t) {
  std::vector<model::ClaimRecord> out;
  for (const auto& [_, claim] : TX(t).View().claims) out.push_back(claim);
  return out;
}

Result MemoryRepository::DeleteAllClaims(Transaction& t) {
  TX(t).Mutable().claims.clear();
  return Result::Ok();
}

// ------------------------------------------------------------------
// Devices
// ------------------------------------------------------------------

Result MemoryRepository::UpsertDevice(Transaction& t, const model::DeviceRecord& r) {
  if (r.hostname.empty()) return Result::Err(ErrorCode::ConstraintViolation, "device hostname is empty");
  TX(t).Mutable().devices[r.hostname] = r;
  return Result::Ok();
}

std::optional<model::DeviceRecord> MemoryRepository::GetDevice(Transaction& t, const std::string& hostname) {
  const auto& s  = TX(t).View();
  auto        it = s.devices.find(hostname);
  if (it == s.devices.end()) return std::nullopt;
  return it->second;
}

std::vector<model::DeviceRecord> MemoryRepository::ListDevices(Transaction& t) {
  std::vector<model::DeviceRecord> out;
  for (const auto& [_, device] : TX(t).View().devices) out.push_back(device);
  return out;
}

Result MemoryRepository::DeleteAllDevices(Transaction& t) {
  TX(t).Mutable().devices.clear();
  return Result::Ok();
}

// ------------------------------------------------------------------
// Edges
// ------------------------------------------------------------------

Result MemoryRepository::UpsertEdge(Transaction& t, const model::NeighborEdgeRecord& r) {
  TX(t).Mutable().edges[EdgeKey{r.from_hostname, r.to_hostname, r.local_interface}] = r;
  return Result::Ok();
}

std::vector<model::NeighborEdgeRecord> MemoryRepository::ListEdges(Transaction& t) {
  std::vector<model::NeighborEdgeRecord> out;
  for (const auto& [_, edge] : TX(t).View().edges) out.push_back(edge);
  return out;
}

Result MemoryRepository::DeleteAllEdges(Transaction& t) {
  TX(t).Mutable().edges.clear();
  return Result::Ok();
}

} // namespace netcrawl::db::memory
