#include "internal/connector/exec_connector.hpp"
#include "internal/connector/replay_connector.hpp"
#include "internal/util/errors.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

namespace {

using netcrawl::connector::CommandSlug;
using netcrawl::connector::Credentials;
using netcrawl::connector::ExecConnector;
using netcrawl::connector::ExecConnectorOptions;
using netcrawl::connector::LooksLikeCommandError;
using netcrawl::connector::ReplayConnector;
using netcrawl::connector::ShellQuote;

namespace util = netcrawl::util;
namespace fs   = std::filesystem;

constexpr std::chrono::milliseconds kTimeout{5000};

const Credentials kCredentials{"netops", "secret"};

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestCommandSlug() {
  assert(CommandSlug("show version") == "show_version");
  assert(CommandSlug("show cdp neighbors detail") == "show_cdp_neighbors_detail");
  assert(CommandSlug("  Show  Inventory | i PID ") == "show_inventory_i_pid");
}

void TestLooksLikeCommandError() {
  assert(LooksLikeCommandError("% Invalid input detected at '^' marker."));
  assert(LooksLikeCommandError("% Incomplete command."));
  assert(!LooksLikeCommandError("Cisco IOS Software, Version 16.12.4"));
}

void TestReplayConnector() {
  const auto dir = fs::temp_directory_path() / "netcrawl_connector_test_captures";
  fs::remove_all(dir);
  fs::create_directories(dir / "sw1");
  {
    std::ofstream(dir / "sw1" / "show_version.txt") << "sw1 uptime is 1 day\n";
    std::ofstream(dir / "sw1" / "show_running_config.txt") << "% Invalid input detected at '^' marker.\n";
  }

  ReplayConnector connector(dir.string());

  auto handle = connector.Open("sw1", kCredentials, "cisco_ios", kTimeout);
  assert(handle.address == "sw1");
  assert(handle.family == "cisco_ios");
  assert(connector.SendCommand(handle, "show version", kTimeout) == "sw1 uptime is 1 day\n");

  // no capture, and a capture of a rejected command
  assert(Throws<util::CommandError>([&] { connector.SendCommand(handle, "show inventory", kTimeout); }));
  assert(Throws<util::CommandError>([&] { connector.SendCommand(handle, "show running-config", kTimeout); }));

  connector.Close(handle);
  connector.Close(handle);
  assert(Throws<util::ConnectionError>([&] { connector.SendCommand(handle, "show version", kTimeout); }));

  assert(Throws<util::ConnectionError>([&] { connector.Open("sw2", kCredentials, "cisco_ios", kTimeout); }));
  assert(Throws<util::ConnectionError>([&] { connector.Open("sw1", Credentials{"", "x"}, "cisco_ios", kTimeout); }));

  fs::remove_all(dir);
}

void TestShellQuote() {
  assert(ShellQuote("show version") == "'show version'");
  assert(ShellQuote("it's") == "'it'\\''s'");
  assert(ShellQuote("") == "''");
}

void TestExecConnector() {
  assert(Throws<util::ConfigError>([] { ExecConnector connector(ExecConnectorOptions{"ssh {host}", ""}); }));

  {
    ExecConnector connector(ExecConnectorOptions{"printf '%s@%s:%s' {username} {host} {command}", ""});
    auto          handle = connector.Open("sw1", kCredentials, "cisco_ios", kTimeout);
    assert(connector.SendCommand(handle, "show version", kTimeout) == "netops@sw1:show version");
    connector.Close(handle);
  }

  {
    ExecConnector connector(ExecConnectorOptions{"sh -c 'exit 255' _ {command}", ""});
    auto          handle = connector.Open("sw1", kCredentials, "cisco_ios", kTimeout);
    assert(Throws<util::ConnectionError>([&] { connector.SendCommand(handle, "show version", kTimeout); }));
  }

  {
    ExecConnector connector(ExecConnectorOptions{"sh -c 'exit 3' _ {command}", ""});
    auto          handle = connector.Open("sw1", kCredentials, "cisco_ios", kTimeout);
    assert(Throws<util::CommandError>([&] { connector.SendCommand(handle, "show version", kTimeout); }));
  }

  {
    ExecConnector connector(ExecConnectorOptions{"echo '% Invalid input detected' {command}", ""});
    auto          handle = connector.Open("sw1", kCredentials, "cisco_ios", kTimeout);
    assert(Throws<util::CommandError>([&] { connector.SendCommand(handle, "show bogus", kTimeout); }));
  }

  {
    ExecConnector connector(ExecConnectorOptions{"sh -c 'sleep 5' _ {command}", ""});
    auto          handle = connector.Open("sw1", kCredentials, "cisco_ios", kTimeout);
    assert(Throws<util::CommandTimeoutError>([&] { connector.SendCommand(handle, "show version", std::chrono::milliseconds(1000)); }));
  }

  {
    ExecConnector connector(ExecConnectorOptions{"printf ok {command}", "sh -c 'exit 1' _ {host}"});
    assert(Throws<util::ConnectionError>([&] { connector.Open("sw1", kCredentials, "cisco_ios", kTimeout); }));
  }
}

} // namespace

int main() {
  TestCommandSlug();
  TestLooksLikeCommandError();
  TestReplayConnector();
  TestShellQuote();
  TestExecConnector();

  std::cout << "netcrawl_unit_connector: pass\n";
  return 0;
}
