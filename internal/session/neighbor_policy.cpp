#include "neighbor_policy.hpp"

#include <algorithm>
#include <cctype>

#include "config/config.pb.h"
#include "internal/util/errors.hpp"

namespace netcrawl::session {

const std::vector<std::string> kDefaultSkipPlatforms          = {"IP Phone", "Phone", "CIPC", "CTS", "CP-"};
const std::vector<std::string> kDefaultInventoryOnlyPlatforms = {"AIR-", "C91"};

namespace {

std::string Lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

bool ContainsAny(const std::string& haystack, const std::vector<std::string>& needles) {
  const auto lowered = Lower(haystack);
  return std::any_of(needles.begin(), needles.end(), [&](const std::string& needle) {
    return !needle.empty() && lowered.find(Lower(needle)) != std::string::npos;
  });
}

} // namespace

NeighborPolicy::NeighborPolicy()
    : default_family_("cisco_ios"), skip_platforms_(kDefaultSkipPlatforms), inventory_only_platforms_(kDefaultInventoryOnlyPlatforms) {
}

NeighborPolicy::NeighborPolicy(const netcrawl::runtime::config::CrawlConfig& config) : NeighborPolicy() {
  keep_domain_ = config.keep_domain();
  if (!config.default_family().empty()) default_family_ = config.default_family();

  if (config.skip_platforms_size() > 0) {
    skip_platforms_.assign(config.skip_platforms().begin(), config.skip_platforms().end());
  }
  if (config.inventory_only_platforms_size() > 0) {
    inventory_only_platforms_.assign(config.inventory_only_platforms().begin(), config.inventory_only_platforms().end());
  }

  for (const auto& entry : config.family_overrides()) {
    AddFamilyOverride(entry.platform_pattern(), entry.family());
  }
}

void NeighborPolicy::AddFamilyOverride(const std::string& platform_pattern, std::string family) {
  try {
    family_overrides_.emplace_back(std::regex(platform_pattern, std::regex::ECMAScript | std::regex::icase), std::move(family));
  } catch (const std::regex_error& e) {
    throw util::ConfigError("invalid family override pattern '" + platform_pattern + "': " + e.what());
  }
}

NeighborDisposition NeighborPolicy::Classify(const std::string& platform) const {
  if (ContainsAny(platform, skip_platforms_)) return NeighborDisposition::kSkip;
  if (ContainsAny(platform, inventory_only_platforms_)) return NeighborDisposition::kInventoryOnly;
  return NeighborDisposition::kCrawl;
}

std::string NeighborPolicy::FamilyFor(const std::string& platform) const {
  for (const auto& [pattern, family] : family_overrides_) {
    if (std::regex_search(platform, pattern)) return family;
  }
  return default_family_;
}

} // namespace netcrawl::session
