#include "device_session.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/textfsm/parser.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hostname.hpp"
#include "internal/util/time.hpp"

namespace netcrawl::session {

using observability::IntField;
using observability::StringField;

const char* ToString(SessionState state) {
  switch (state) {
    case SessionState::kDisconnected:
      return "disconnected";
    case SessionState::kConnecting:
      return "connecting";
    case SessionState::kAuthenticated:
      return "authenticated";
    case SessionState::kIdentifying:
      return "identifying";
    case SessionState::kDiscovering:
      return "discovering";
    case SessionState::kClosing:
      return "closing";
    case SessionState::kClosed:
      return "closed";
    case SessionState::kFailed:
      return "failed";
  }
  return "unknown";
}

const char* ToString(FailureKind kind) {
  switch (kind) {
    case FailureKind::kConnectionError:
      return "ConnectionError";
    case FailureKind::kCommandTimeoutError:
      return "CommandTimeoutError";
    case FailureKind::kCommandError:
      return "CommandError";
    case FailureKind::kParseError:
      return "ParseError";
  }
  return "UnknownError";
}

namespace {

bool IsBlank(const std::string& s) {
  return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

// Closes the connector handle when the visit leaves scope, whatever the path.
class HandleGuard {
 public:
  explicit HandleGuard(connector::Connector& connector) : connector_(connector) {
  }
  ~HandleGuard() {
    Reset();
  }

  HandleGuard(const HandleGuard&)            = delete;
  HandleGuard& operator=(const HandleGuard&) = delete;

  void Adopt(connector::SessionHandle handle) {
    handle_ = std::move(handle);
  }

  bool Active() const {
    return handle_.has_value();
  }

  const connector::SessionHandle& Get() const {
    return *handle_;
  }

  void Reset() noexcept {
    if (handle_) {
      connector_.Close(*handle_);
      handle_.reset();
    }
  }

 private:
  connector::Connector&                   connector_;
  std::optional<connector::SessionHandle> handle_;
};

// show version repeats model and serial in several places
std::vector<std::string> Unique(const std::vector<std::string>& values) {
  std::vector<std::string> out;
  for (const auto& value : values) {
    if (std::find(out.begin(), out.end(), value) == out.end()) out.push_back(value);
  }
  return out;
}

std::string VersionFromDescription(const std::string& description) {
  static const std::regex kVersion(R"(Version:?\s+([^,\s]+))", std::regex::icase);
  std::smatch             match;
  if (std::regex_search(description, match, kVersion)) return match[1].str();
  return {};
}

void WarnOversized(const textfsm::Parser& parser, const std::string& host, const std::string& command) {
  if (parser.OversizedLines() == 0) return;
  NETCRAWL_LOG_WARN("overlong output lines ignored", {StringField("host", host), StringField("command", command),
                                                      IntField("lines", static_cast<int64_t>(parser.OversizedLines()))});
}

} // namespace

DeviceSession::DeviceSession(connector::Connector& connector, std::shared_ptr<const FamilyRegistry> families, SessionOptions options,
                             NeighborPolicy policy)
    : connector_(connector), families_(std::move(families)), options_(options), policy_(std::move(policy)) {
  if (!families_) throw util::ConfigError("device session requires a family registry");
}

void DeviceSession::Transition(SessionState next) {
  state_ = next;
  history_.push_back(next);
}

VisitResult DeviceSession::Visit(const crawl::FrontierEntry& entry, const connector::Credentials& credentials) {
  history_.clear();
  Transition(SessionState::kDisconnected);

  VisitResult result;
  result.record.hostname = entry.hostname;

  const auto& family = families_->Get(entry.family);

  HandleGuard guard(connector_);
  auto        fail = [&](FailureKind kind, const char* what) {
    Transition(SessionState::kFailed);
    result.failure = VisitFailure{kind, what};
  };

  try {
    Transition(SessionState::kConnecting);
    guard.Adopt(OpenWithFallback(entry, credentials));
    Transition(SessionState::kAuthenticated);

    Transition(SessionState::kIdentifying);
    result.record = Identify(guard.Get(), family, entry);

    Transition(SessionState::kDiscovering);
    Discover(guard.Get(), family, result);
  } catch (const util::ConnectionError& e) {
    fail(FailureKind::kConnectionError, e.what());
  } catch (const util::CommandTimeoutError& e) {
    fail(FailureKind::kCommandTimeoutError, e.what());
  } catch (const util::CommandError& e) {
    fail(FailureKind::kCommandError, e.what());
  } catch (const util::ParseError& e) {
    fail(FailureKind::kParseError, e.what());
  }

  if (guard.Active()) {
    Transition(SessionState::kClosing);
    guard.Reset();
  }
  Transition(SessionState::kClosed);

  if (result.failure) {
    NETCRAWL_LOG_WARN("visit failed", {StringField("host", entry.hostname), StringField("kind", ToString(result.failure->kind)),
                                       StringField("error", result.failure->message)});
  } else {
    NETCRAWL_LOG_INFO("visit complete", {StringField("host", entry.hostname), StringField("identified", result.record.hostname),
                                         IntField("neighbors", static_cast<int64_t>(result.neighbors.size())),
                                         IntField("dropped", static_cast<int64_t>(result.dropped_neighbors)),
                                         IntField("skipped", static_cast<int64_t>(result.skipped_neighbors))});
  }
  return result;
}

connector::SessionHandle DeviceSession::OpenWithFallback(const crawl::FrontierEntry& entry, const connector::Credentials& credentials) {
  try {
    return connector_.Open(entry.hostname, credentials, entry.family, options_.connect_timeout);
  } catch (const util::ConnectionError& e) {
    if (entry.address_hint.empty() || entry.address_hint == entry.hostname) throw;

    NETCRAWL_LOG_WARN("open by name failed, trying management address",
                      {StringField("host", entry.hostname), StringField("address", entry.address_hint), StringField("error", e.what())});
  }

  try {
    return connector_.Open(entry.address_hint, credentials, entry.family, options_.connect_timeout);
  } catch (const util::ConnectionError& e) {
    throw util::ConnectionError("unreachable as " + entry.hostname + " and " + entry.address_hint + ": " + e.what());
  }
}

std::string DeviceSession::RunCommand(const connector::SessionHandle& handle, const std::string& command) {
  const uint32_t attempts = options_.command_retries + 1;
  auto           backoff  = options_.retry_backoff;

  for (uint32_t attempt = 1;; ++attempt) {
    try {
      auto output = connector_.SendCommand(handle, command, options_.command_timeout);
      if (!IsBlank(output)) return output;
      if (attempt >= attempts) return {};

      NETCRAWL_LOG_WARN("empty command output, retrying",
                        {StringField("host", handle.address), StringField("command", command), IntField("attempt", attempt)});
    } catch (const util::CommandTimeoutError&) {
      if (attempt >= attempts) throw;

      NETCRAWL_LOG_WARN("command timed out, retrying",
                        {StringField("host", handle.address), StringField("command", command), IntField("attempt", attempt)});
    } catch (const util::CommandError& e) {
      if (attempt >= attempts) throw;

      NETCRAWL_LOG_WARN("command failed, retrying", {StringField("host", handle.address), StringField("command", command),
                                                     IntField("attempt", attempt), StringField("error", e.what())});
    }

    std::this_thread::sleep_for(backoff);
    backoff *= 2;
  }
}

db::model::DeviceRecord DeviceSession::Identify(const connector::SessionHandle& handle, const DeviceFamily& family,
                                                const crawl::FrontierEntry& entry) {
  const auto output = RunCommand(handle, family.identify_command);
  if (output.empty()) {
    throw util::CommandError("no output for '" + family.identify_command + "' from " + handle.address);
  }

  textfsm::Parser parser(family.identify_template);
  const auto      records = parser.ParseText(output);
  WarnOversized(parser, handle.address, family.identify_command);
  if (records.empty()) {
    throw util::ParseError("'" + family.identify_command + "' output from " + handle.address + " has no " +
                           family.identify_template->Name() + " record with a hostname");
  }

  const auto& parsed = records.front();

  db::model::DeviceRecord record;
  record.hostname = util::NormalizeHostname(parsed.Get("HOSTNAME"), {policy_.KeepDomain()});
  if (record.hostname.empty()) {
    throw util::ParseError("unusable hostname '" + parsed.Get("HOSTNAME") + "' from " + handle.address);
  }

  if (util::IsIPv4Literal(entry.hostname)) {
    record.mgmt_ip = entry.hostname;
  } else {
    record.mgmt_ip = entry.address_hint;
  }

  record.serial_numbers   = Unique(parsed.GetList("SERIAL"));
  record.platform         = Unique(parsed.GetList("HARDWARE"));
  record.software_version = parsed.Get("VERSION");
  record.rommon_version   = parsed.Get("ROMMON");
  record.config_register  = parsed.Get("CONFIG_REGISTER");
  record.uptime           = parsed.Get("UPTIME");
  record.reload_reason    = parsed.Get("RELOAD_REASON");
  record.device_family    = family.name;
  record.last_crawled_ms  = util::NowMs();
  record.crawl_status     = db::model::CrawlStatus::kOk;

  const auto& macs = parsed.GetList("MAC_ADDRESS");
  if (!macs.empty()) record.mac_address = macs.front();

  record.software_image = parsed.Get("SOFTWARE_IMAGE");
  if (record.software_image.empty()) record.software_image = parsed.Get("RUNNING_IMAGE");

  return record;
}

void DeviceSession::Discover(const connector::SessionHandle& handle, const DeviceFamily& family, VisitResult& result) {
  const auto output = RunCommand(handle, family.neighbors_command);

  textfsm::Parser parser(family.neighbors_template);
  const auto      records = parser.ParseText(output);
  result.dropped_neighbors += parser.DroppedRecords();
  WarnOversized(parser, handle.address, family.neighbors_command);

  const util::HostnameOptions options{policy_.KeepDomain()};
  const auto                  now = util::NowMs();

  for (const auto& parsed : records) {
    auto name = util::NormalizeHostname(parsed.Get("NEIGHBOR_NAME"), options);
    if (name.empty()) {
      result.dropped_neighbors++;
      continue;
    }

    const auto& platform    = parsed.Get("PLATFORM");
    const auto  disposition = policy_.Classify(platform);
    if (disposition == NeighborDisposition::kSkip) {
      result.skipped_neighbors++;
      continue;
    }

    auto address = parsed.Get("MGMT_ADDRESS");
    if (address.empty()) address = parsed.Get("INTERFACE_ADDRESS");

    DiscoveredNeighbor neighbor;
    neighbor.disposition  = disposition;
    neighbor.entry        = crawl::FrontierEntry{name, address, policy_.FamilyFor(platform)};

    neighbor.edge.from_hostname      = result.record.hostname;
    neighbor.edge.to_hostname        = name;
    neighbor.edge.local_interface    = parsed.Get("LOCAL_INTERFACE");
    neighbor.edge.neighbor_interface = parsed.Get("NEIGHBOR_INTERFACE");
    neighbor.edge.platform           = platform;
    neighbor.edge.discovered_at_ms   = now;

    if (disposition == NeighborDisposition::kInventoryOnly) {
      db::model::DeviceRecord inventory;
      inventory.hostname         = name;
      inventory.mgmt_ip          = address;
      inventory.platform         = {platform};
      inventory.software_version = VersionFromDescription(parsed.Get("NEIGHBOR_DESCRIPTION"));
      inventory.device_family    = neighbor.entry.family;
      inventory.last_crawled_ms  = now;
      inventory.crawl_status     = db::model::CrawlStatus::kOk;
      neighbor.inventory_record  = std::move(inventory);
    }

    result.neighbors.push_back(std::move(neighbor));
  }
}

} // namespace netcrawl::session
