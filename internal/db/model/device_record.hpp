#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace netcrawl::db::model {

enum class CrawlStatus : std::uint8_t {
  kOk    = 0,
  kError = 1,
};

inline const char* ToString(CrawlStatus status) {
  return status == CrawlStatus::kOk ? "ok" : "error";
}

/*
  Persistent device row, one per unique hostname.

  IMPORTANT:
  - hostname is the normalized crawl key; nothing else is ever stored or compared.
  - Created only after a successful identification; updated in place on re-crawl.
*/
struct DeviceRecord {
  std::string hostname;
  std::string mgmt_ip;

  // stacked units report one serial / model per member
  std::vector<std::string> serial_numbers;
  std::vector<std::string> platform;

  std::string software_version;
  std::string rommon_version;
  std::string config_register;
  std::string mac_address;
  std::string uptime;

  std::string software_image;
  std::string reload_reason;
  std::string device_family;

  uint64_t last_crawled_ms = 0;

  CrawlStatus crawl_status = CrawlStatus::kOk;
  std::string crawl_error;
};

} // namespace netcrawl::db::model
