#pragma once

#include <cstdint>
#include <string>

namespace netcrawl::db::model {

/*
  Crawl membership for one hostname. A hostname without a row is unseen.

    unseen --TryClaim--> claimed --> crawled
                                 \-> errored
*/
enum class ClaimStatus : std::uint8_t {
  kUnseen  = 0,
  kClaimed = 1,
  kCrawled = 2,
  kErrored = 3,
};

inline const char* ToString(ClaimStatus status) {
  switch (status) {
    case ClaimStatus::kUnseen:
      return "unseen";
    case ClaimStatus::kClaimed:
      return "claimed";
    case ClaimStatus::kCrawled:
      return "crawled";
    case ClaimStatus::kErrored:
      return "errored";
  }
  return "unknown";
}

constexpr bool IsTerminal(ClaimStatus status) {
  return status == ClaimStatus::kCrawled || status == ClaimStatus::kErrored;
}

struct ClaimRecord {
  std::string hostname;
  ClaimStatus status = ClaimStatus::kUnseen;

  // "<ErrorKind>: <message>" for kErrored
  std::string reason;

  uint64_t claimed_at_ms = 0;
  uint64_t updated_at_ms = 0;
};

} // namespace netcrawl::db::model
