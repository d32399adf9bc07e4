#pragma once

#include <string>

namespace netcrawl::crawl {

/*
  One queued visit. `hostname` is the normalized crawl key; `address_hint`
  is the management IP reported by the neighbor that discovered it.
*/
struct FrontierEntry {
  std::string hostname;
  std::string address_hint;
  std::string family;
};

} // namespace netcrawl::crawl
