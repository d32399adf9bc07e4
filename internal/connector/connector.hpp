#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace netcrawl::connector {

struct Credentials {
  std::string username;
  std::string password;
};

/*
  Opaque token for one remote session. Only the connector that issued it
  may interpret it.
*/
struct SessionHandle {
  uint64_t    id = 0;
  std::string address;
  std::string family;
};

/*
  Connector

  Remote command capability used by the device session. One instance per
  crawl worker; implementations need not be thread-safe.

  Open        -> util::ConnectionError
  SendCommand -> util::CommandTimeoutError | util::CommandError | util::ConnectionError
  Close       never throws, safe to call twice
*/
class Connector {
 public:
  virtual ~Connector() = default;

  virtual SessionHandle Open(const std::string& address, const Credentials& credentials, const std::string& family,
                             std::chrono::milliseconds connect_timeout) = 0;

  virtual std::string SendCommand(const SessionHandle& handle, const std::string& command, std::chrono::milliseconds timeout) = 0;

  virtual void Close(const SessionHandle& handle) noexcept = 0;
};

using ConnectorFactory = std::function<std::unique_ptr<Connector>()>;

// Device CLI output reporting a rejected command.
bool LooksLikeCommandError(const std::string& output);

} // namespace netcrawl::connector
