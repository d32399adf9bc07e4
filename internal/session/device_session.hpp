#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/connector/connector.hpp"
#include "internal/crawl/frontier_entry.hpp"
#include "internal/db/model/device_record.hpp"
#include "internal/db/model/neighbor_edge_record.hpp"
#include "device_family.hpp"
#include "neighbor_policy.hpp"

namespace netcrawl::session {

enum class SessionState {
  kDisconnected,
  kConnecting,
  kAuthenticated,
  kIdentifying,
  kDiscovering,
  kClosing,
  kClosed,
  kFailed,
};

const char* ToString(SessionState state);

enum class FailureKind {
  kConnectionError,
  kCommandTimeoutError,
  kCommandError,
  kParseError,
};

const char* ToString(FailureKind kind);

struct VisitFailure {
  FailureKind kind = FailureKind::kConnectionError;
  std::string message;
};

struct DiscoveredNeighbor {
  crawl::FrontierEntry          entry;
  db::model::NeighborEdgeRecord edge;

  NeighborDisposition disposition = NeighborDisposition::kCrawl;

  // set for kInventoryOnly: what CDP told us about the device
  std::optional<db::model::DeviceRecord> inventory_record;
};

struct VisitResult {
  db::model::DeviceRecord         record;
  std::vector<DiscoveredNeighbor> neighbors;
  std::optional<VisitFailure>     failure;

  // malformed neighbor blocks and skipped platforms
  std::size_t dropped_neighbors = 0;
  std::size_t skipped_neighbors = 0;

  bool Ok() const { return !failure.has_value(); }
};

struct SessionOptions {
  std::chrono::milliseconds connect_timeout{20000};
  std::chrono::milliseconds command_timeout{30000};

  // extra attempts after a timeout or empty output
  uint32_t                  command_retries = 2;
  std::chrono::milliseconds retry_backoff{500};
};

/*
  DeviceSession

  One login to one device:

    Disconnected -> Connecting -> Authenticated -> Identifying
                 -> Discovering -> Closing -> Closed

  Failed(reason) is reachable from every non-terminal state; the connector
  handle is closed on every path.

  Reusable: each Visit() starts from Disconnected. Not thread-safe; one
  session per worker.
*/
class DeviceSession {
 public:
  DeviceSession(connector::Connector& connector, std::shared_ptr<const FamilyRegistry> families, SessionOptions options,
                NeighborPolicy policy);

  VisitResult Visit(const crawl::FrontierEntry& entry, const connector::Credentials& credentials);

  SessionState State() const { return state_; }

  // states entered during the last Visit(), in order
  const std::vector<SessionState>& History() const { return history_; }

 private:
  void Transition(SessionState next);

  connector::SessionHandle OpenWithFallback(const crawl::FrontierEntry& entry, const connector::Credentials& credentials);

  std::string RunCommand(const connector::SessionHandle& handle, const std::string& command);

  db::model::DeviceRecord Identify(const connector::SessionHandle& handle, const DeviceFamily& family, const crawl::FrontierEntry& entry);

  void Discover(const connector::SessionHandle& handle, const DeviceFamily& family, VisitResult& result);

  connector::Connector&                 connector_;
  std::shared_ptr<const FamilyRegistry> families_;
  SessionOptions                        options_;
  NeighborPolicy                        policy_;

  SessionState              state_ = SessionState::kDisconnected;
  std::vector<SessionState> history_;
};

} // namespace netcrawl::session
