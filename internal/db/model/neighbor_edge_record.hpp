#pragma once

#include <cstdint>
#include <string>

namespace netcrawl::db::model {

/*
  Directed CDP adjacency as seen from `from_hostname`.

  Upserted on (from_hostname, to_hostname, local_interface).
*/
struct NeighborEdgeRecord {
  std::string from_hostname;
  std::string to_hostname;

  std::string local_interface;
  std::string neighbor_interface;
  std::string platform;

  uint64_t discovered_at_ms = 0;
};

} // namespace netcrawl::db::model
