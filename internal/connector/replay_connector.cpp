#include "replay_connector.hpp"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

#include "internal/util/errors.hpp"

namespace netcrawl::connector {

namespace fs = std::filesystem;

std::string CommandSlug(const std::string& command) {
  std::string slug;
  for (unsigned char c : command) {
    if (std::isalnum(c)) {
      slug.push_back(static_cast<char>(std::tolower(c)));
    } else if (!slug.empty() && slug.back() != '_') {
      slug.push_back('_');
    }
  }
  while (!slug.empty() && slug.back() == '_') slug.pop_back();
  return slug;
}

ReplayConnector::ReplayConnector(std::string capture_dir) : capture_dir_(std::move(capture_dir)) {
}

SessionHandle ReplayConnector::Open(const std::string& address, const Credentials& credentials, const std::string& family,
                                    std::chrono::milliseconds) {
  if (credentials.username.empty()) {
    throw util::ConnectionError("authentication failed for " + address + ": no username");
  }

  std::error_code ec;
  if (!fs::is_directory(fs::path(capture_dir_) / address, ec)) {
    throw util::ConnectionError("host unreachable: " + address);
  }

  SessionHandle handle;
  handle.id      = next_id_++;
  handle.address = address;
  handle.family  = family;
  open_.insert(handle.id);
  return handle;
}

std::string ReplayConnector::SendCommand(const SessionHandle& handle, const std::string& command, std::chrono::milliseconds) {
  if (!open_.contains(handle.id)) {
    throw util::ConnectionError("session to " + handle.address + " is not open");
  }

  const auto path = fs::path(capture_dir_) / handle.address / (CommandSlug(command) + ".txt");
  std::ifstream in(path);
  if (!in) {
    throw util::CommandError("Invalid command: " + command);
  }

  std::ostringstream buffer;
  buffer << in.rdbuf();
  auto output = buffer.str();
  if (LooksLikeCommandError(output)) {
    throw util::CommandError("Invalid command: " + command);
  }
  return output;
}

void ReplayConnector::Close(const SessionHandle& handle) noexcept {
  open_.erase(handle.id);
}

} // namespace netcrawl::connector
