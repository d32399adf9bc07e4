#pragma once

#include <regex>
#include <string>
#include <utility>
#include <vector>

namespace netcrawl::runtime::config {
class CrawlConfig;
}

namespace netcrawl::session {

enum class NeighborDisposition {
  kCrawl,         // claim and log into
  kInventoryOnly, // record from CDP data, never log into (access points)
  kSkip,          // ignore (IP phones)
};

/*
  What to do with a CDP neighbor, decided from its platform string alone.
  Platform patterns are case-insensitive substrings.
*/
class NeighborPolicy {
 public:
  NeighborPolicy();
  explicit NeighborPolicy(const netcrawl::runtime::config::CrawlConfig& config);

  NeighborDisposition Classify(const std::string& platform) const;

  // First matching family override, else the default family.
  std::string FamilyFor(const std::string& platform) const;

  bool KeepDomain() const { return keep_domain_; }

  void SetDefaultFamily(std::string family) { default_family_ = std::move(family); }

  void AddFamilyOverride(const std::string& platform_pattern, std::string family);

 private:
  bool                     keep_domain_ = false;
  std::string              default_family_;
  std::vector<std::string> skip_platforms_;
  std::vector<std::string> inventory_only_platforms_;

  std::vector<std::pair<std::regex, std::string>> family_overrides_;
};

extern const std::vector<std::string> kDefaultSkipPlatforms;
extern const std::vector<std::string> kDefaultInventoryOnlyPlatforms;

} // namespace netcrawl::session
