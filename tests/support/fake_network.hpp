#pragma once

#include <algorithm>
#include <cctype>
#include <map>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

#include "internal/connector/connector.hpp"
#include "internal/util/errors.hpp"

namespace netcrawl::testing {

/*
  In-process stand-in for a CDP-connected lab. Renders IOS-style
  "show version" / "show cdp neighbors detail" text for each device and
  counts logins, so tests can assert each device is visited exactly once.
*/
struct FakeLink {
  std::string local_interface;
  std::string neighbor;
  std::string neighbor_interface;
};

struct FakeDevice {
  std::string hostname; // as configured on the device, e.g. "A"
  std::string domain = "lab.example.com";
  std::string ip;
  std::string model    = "WS-C3850-24";
  std::string serial;
  std::string platform = "cisco WS-C3850-24"; // what neighbors report over CDP

  bool unreachable = false;

  // false: only the management IP answers, the name does not resolve
  bool resolvable_by_name = true;

  // returned verbatim by "show version" when set
  std::string version_output;

  // this many "show version" calls time out before one succeeds
  int version_timeouts = 0;

  // then this many fail with a CommandError, as a dropped remote shell would
  int version_errors = 0;

  std::vector<FakeLink> links;
};

inline std::string Lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

class FakeNetwork {
 public:
  void AddDevice(FakeDevice device) {
    std::lock_guard lock(mutex_);
    if (device.serial.empty()) device.serial = "FOC" + device.hostname + "0001";
    devices_[Lower(device.hostname)] = std::move(device);
  }

  // cabled in both directions
  void Link(const std::string& a, const std::string& a_if, const std::string& b, const std::string& b_if) {
    std::lock_guard lock(mutex_);
    devices_.at(Lower(a)).links.push_back(FakeLink{a_if, b, b_if});
    devices_.at(Lower(b)).links.push_back(FakeLink{b_if, a, a_if});
  }

  int Opens(const std::string& hostname) const {
    std::lock_guard lock(mutex_);
    auto            it = opens_.find(Lower(hostname));
    return it == opens_.end() ? 0 : it->second;
  }

  int TotalOpens() const {
    std::lock_guard lock(mutex_);
    int             total = 0;
    for (const auto& [_, count] : opens_) total += count;
    return total;
  }

  int Closes() const {
    std::lock_guard lock(mutex_);
    return closes_;
  }

  // Resolves a bare name, a FQDN or an IP to a device key.
  std::string Resolve(const std::string& address) const {
    std::lock_guard lock(mutex_);
    return ResolveLocked(address);
  }

  void Open(const std::string& address) {
    std::lock_guard lock(mutex_);
    const auto      key = ResolveLocked(address);
    if (key.empty() || devices_.at(key).unreachable) {
      throw util::ConnectionError("timeout connecting to " + address);
    }
    opens_[key]++;
  }

  void Close() {
    std::lock_guard lock(mutex_);
    closes_++;
  }

  std::string Command(const std::string& address, const std::string& command) {
    std::lock_guard lock(mutex_);
    const auto      key    = ResolveLocked(address);
    auto&           device = devices_.at(key);

    if (command == "show version") {
      if (device.version_timeouts > 0) {
        device.version_timeouts--;
        throw util::CommandTimeoutError("show version timed out on " + address);
      }
      if (device.version_errors > 0) {
        device.version_errors--;
        throw util::CommandError("'show version' exited with 255 on " + address);
      }
      if (!device.version_output.empty()) return device.version_output;
      return ShowVersion(device);
    }
    if (command == "show cdp neighbors detail") return ShowCdp(device);
    return "% Invalid input detected at '^' marker.\n";
  }

 private:
  std::string ResolveLocked(const std::string& address) const {
    const auto lowered = Lower(address);
    for (const auto& [key, device] : devices_) {
      if (device.ip == address) return key;
      if (!device.resolvable_by_name) continue;
      if (key == lowered || Lower(device.hostname + "." + device.domain) == lowered) return key;
    }
    return {};
  }

  static std::string ShowVersion(const FakeDevice& device) {
    std::ostringstream out;
    out << "Cisco IOS Software [Gibraltar], Catalyst L3 Switch Software (CAT3K_CAA-UNIVERSALK9-M), Version 16.12.4, RELEASE SOFTWARE (fc5)\n"
        << "ROM: IOS-XE ROMMON\n"
        << "\n"
        << device.hostname << "." << device.domain << " uptime is 3 days, 2 hours, 1 minute\n"
        << "System returned to ROM by reload\n"
        << "System image file is \"flash:packages.conf\"\n"
        << "\n"
        << "cisco " << device.model << " (MIPS) processor (revision AA0) with 795762K/6147K bytes of memory.\n"
        << "Processor board ID " << device.serial << "\n"
        << "Base Ethernet MAC Address          : 00:1a:2b:3c:4d:5e\n"
        << "Configuration register is 0x102\n";
    return out.str();
  }

  std::string ShowCdp(const FakeDevice& device) const {
    std::ostringstream out;
    for (const auto& link : device.links) {
      const auto& peer = devices_.at(Lower(link.neighbor));
      out << "-------------------------\n"
          << "Device ID: " << peer.hostname << "." << peer.domain << "\n"
          << "Entry address(es): \n"
          << "  IP address: " << peer.ip << "\n"
          << "Platform: " << peer.platform << ",  Capabilities: Router Switch IGMP \n"
          << "Interface: " << link.local_interface << ",  Port ID (outgoing port): " << link.neighbor_interface << "\n"
          << "Holdtime : 150 sec\n"
          << "\n"
          << "Version :\n"
          << "Cisco IOS Software, Version 16.12.4, RELEASE SOFTWARE (fc5)\n"
          << "\n";
    }
    return out.str();
  }

  mutable std::mutex                mutex_;
  std::map<std::string, FakeDevice> devices_;
  std::map<std::string, int>        opens_;
  int                               closes_ = 0;
};

class FakeConnector final : public connector::Connector {
 public:
  explicit FakeConnector(FakeNetwork& network) : network_(network) {
  }

  connector::SessionHandle Open(const std::string& address, const connector::Credentials&, const std::string& family,
                                std::chrono::milliseconds) override {
    network_.Open(address);
    return connector::SessionHandle{next_id_++, address, family};
  }

  std::string SendCommand(const connector::SessionHandle& handle, const std::string& command, std::chrono::milliseconds) override {
    auto output = network_.Command(handle.address, command);
    if (connector::LooksLikeCommandError(output)) throw util::CommandError("Invalid command: " + command);
    return output;
  }

  void Close(const connector::SessionHandle&) noexcept override {
    network_.Close();
  }

 private:
  FakeNetwork& network_;
  uint64_t     next_id_ = 1;
};

} // namespace netcrawl::testing
