#include "hostname.hpp"

#include <cctype>
#include <regex>

namespace netcrawl::util {

namespace {

std::string StripDecorations(std::string_view raw) {
  static const std::regex kParenthesized(R"(\([^)]*\))");
  return std::regex_replace(std::string(raw), kParenthesized, "");
}

bool IsHostnameChar(unsigned char c) {
  return std::isalnum(c) || c == '.' || c == '-';
}

std::string Trim(const std::string& value) {
  const auto first = value.find_first_not_of(".-");
  if (first == std::string::npos) return {};
  const auto last = value.find_last_not_of(".-");
  return value.substr(first, last - first + 1);
}

} // namespace

bool IsIPv4Literal(std::string_view value) {
  static const std::regex kIPv4(R"(^\d{1,3}(\.\d{1,3}){3}$)");
  return std::regex_match(value.begin(), value.end(), kIPv4);
}

std::string NormalizeHostname(std::string_view raw, const HostnameOptions& options) {
  std::string filtered;
  for (unsigned char c : StripDecorations(raw)) {
    if (IsHostnameChar(c)) filtered.push_back(static_cast<char>(c));
  }

  std::string host = Trim(filtered);
  if (host.empty()) return host;

  if (!options.keep_domain && !IsIPv4Literal(host)) {
    host = Trim(host.substr(0, host.find('.')));
  }

  for (auto& c : host) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return host;
}

} // namespace netcrawl::util
