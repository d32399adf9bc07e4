#pragma once

#include <string>

#include "connector.hpp"

namespace netcrawl::connector {

struct ExecConnectorOptions {
  // Placeholders: {host} {username} {command} {timeout} (whole seconds).
  std::string command_template;

  // Optional; run once per Open. Non-zero exit means the host is unreachable.
  std::string probe_command;
};

struct ExecResult {
  int         exit_code = -1;
  std::string output;
};

/*
  ExecConnector

  Runs an external remote-shell client once per command. Each run is wrapped
  in timeout(1), so a hung device surfaces as exit status 124.

  The password is never put on the command line; the client is expected to
  read it from the environment (e.g. sshpass -e and SSHPASS).
*/
class ExecConnector final : public Connector {
 public:
  explicit ExecConnector(ExecConnectorOptions options);

  SessionHandle Open(const std::string& address, const Credentials& credentials, const std::string& family,
                     std::chrono::milliseconds connect_timeout) override;

  std::string SendCommand(const SessionHandle& handle, const std::string& command, std::chrono::milliseconds timeout) override;

  void Close(const SessionHandle& handle) noexcept override;

 private:
  std::string Render(const std::string& tmpl, const std::string& host, const std::string& command, std::chrono::milliseconds timeout) const;

  ExecConnectorOptions options_;
  std::string          username_;
  uint64_t             next_id_ = 1;
};

// Wraps `value` in single quotes for /bin/sh.
std::string ShellQuote(const std::string& value);

// popen + pclose; stderr is folded into the output.
ExecResult RunShell(const std::string& command);

} // namespace netcrawl::connector
