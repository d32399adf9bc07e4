#include "exec_connector.hpp"

#include <sys/wait.h>

#include <cstdio>

#include "internal/util/errors.hpp"

namespace netcrawl::connector {

namespace {

constexpr int kTimeoutExitCode = 124;
constexpr int kSshFailureExit  = 255;

long WholeSeconds(std::chrono::milliseconds timeout) {
  const auto ms = timeout.count();
  return ms <= 0 ? 1 : (ms + 999) / 1000;
}

void ReplaceAll(std::string& text, const std::string& from, const std::string& to) {
  std::size_t pos = 0;
  while ((pos = text.find(from, pos)) != std::string::npos) {
    text.replace(pos, from.size(), to);
    pos += to.size();
  }
}

} // namespace

std::string ShellQuote(const std::string& value) {
  std::string quoted = "'";
  for (char c : value) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted.push_back(c);
    }
  }
  quoted.push_back('\'');
  return quoted;
}

ExecResult RunShell(const std::string& command) {
  ExecResult result;

  const std::string wrapped = command + " 2>&1";
  FILE* pipe = popen(wrapped.c_str(), "r");
  if (pipe == nullptr) {
    throw util::ConnectionError("failed to execute: " + command);
  }

  char buffer[4096];
  while (std::fgets(buffer, static_cast<int>(sizeof(buffer)), pipe) != nullptr) {
    result.output.append(buffer);
  }

  const int raw_status = pclose(pipe);
  if (raw_status == -1) {
    result.exit_code = -1;
  } else if (WIFEXITED(raw_status)) {
    result.exit_code = WEXITSTATUS(raw_status);
  } else {
    result.exit_code = raw_status;
  }
  return result;
}

ExecConnector::ExecConnector(ExecConnectorOptions options) : options_(std::move(options)) {
  if (options_.command_template.find("{command}") == std::string::npos) {
    throw util::ConfigError("exec connector command_template must contain {command}");
  }
}

std::string ExecConnector::Render(const std::string& tmpl, const std::string& host, const std::string& command,
                                  std::chrono::milliseconds timeout) const {
  std::string rendered = tmpl;
  ReplaceAll(rendered, "{host}", ShellQuote(host));
  ReplaceAll(rendered, "{username}", ShellQuote(username_));
  ReplaceAll(rendered, "{timeout}", std::to_string(WholeSeconds(timeout)));
  ReplaceAll(rendered, "{command}", ShellQuote(command));
  return "timeout " + std::to_string(WholeSeconds(timeout)) + "s " + rendered;
}

SessionHandle ExecConnector::Open(const std::string& address, const Credentials& credentials, const std::string& family,
                                  std::chrono::milliseconds connect_timeout) {
  username_ = credentials.username;

  if (!options_.probe_command.empty()) {
    const auto probe = RunShell(Render(options_.probe_command, address, "", connect_timeout));
    if (probe.exit_code == kTimeoutExitCode) {
      throw util::ConnectionError("timeout connecting to " + address);
    }
    if (probe.exit_code != 0) {
      throw util::ConnectionError("error connecting to " + address + ": exit " + std::to_string(probe.exit_code));
    }
  }

  SessionHandle handle;
  handle.id      = next_id_++;
  handle.address = address;
  handle.family  = family;
  return handle;
}

std::string ExecConnector::SendCommand(const SessionHandle& handle, const std::string& command, std::chrono::milliseconds timeout) {
  const auto result = RunShell(Render(options_.command_template, handle.address, command, timeout));

  if (result.exit_code == kTimeoutExitCode) {
    throw util::CommandTimeoutError("'" + command + "' timed out on " + handle.address);
  }
  if (result.exit_code == kSshFailureExit) {
    throw util::ConnectionError("error connecting to " + handle.address + ": " + result.output);
  }
  if (LooksLikeCommandError(result.output)) {
    throw util::CommandError("Invalid command: " + command);
  }
  if (result.exit_code != 0) {
    throw util::CommandError("'" + command + "' exited with " + std::to_string(result.exit_code) + " on " + handle.address);
  }
  return result.output;
}

void ExecConnector::Close(const SessionHandle&) noexcept {
  // one process per command; nothing stays open
}

} // namespace netcrawl::connector
