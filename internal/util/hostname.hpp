#pragma once

#include <string>
#include <string_view>

namespace netcrawl::util {

struct HostnameOptions {
  // Keep "sw1.example.com" instead of reducing it to "sw1".
  bool keep_domain = false;
};

/*
  Maps a CDP device ID or a configured seed to the crawl key.

    "SITE-01-SW.example.com"   -> "site-01-sw"
    "SW1(FOC1234X0AB)"         -> "sw1"
    "10.1.1.1"                 -> "10.1.1.1"

  Pure and idempotent: NormalizeHostname(NormalizeHostname(h)) == NormalizeHostname(h).
  Returns an empty string when nothing usable remains.
*/
std::string NormalizeHostname(std::string_view raw, const HostnameOptions& options = {});

bool IsIPv4Literal(std::string_view value);

} // namespace netcrawl::util
