#pragma once

#include <string>
#include <unordered_set>

#include "connector.hpp"

namespace netcrawl::connector {

/*
  ReplayConnector

  Serves captured CLI output instead of talking to devices:

    <capture_dir>/<host>/<command slug>.txt

  A host without a directory is unreachable; a command without a file is
  rejected like an unknown CLI command. Used for offline runs and tests.
*/
class ReplayConnector final : public Connector {
 public:
  explicit ReplayConnector(std::string capture_dir);

  SessionHandle Open(const std::string& address, const Credentials& credentials, const std::string& family,
                     std::chrono::milliseconds connect_timeout) override;

  std::string SendCommand(const SessionHandle& handle, const std::string& command, std::chrono::milliseconds timeout) override;

  void Close(const SessionHandle& handle) noexcept override;

 private:
  std::string                  capture_dir_;
  uint64_t                     next_id_ = 1;
  std::unordered_set<uint64_t> open_;
};

// "show cdp neighbors detail" -> "show_cdp_neighbors_detail"
std::string CommandSlug(const std::string& command);

} // namespace netcrawl::connector
