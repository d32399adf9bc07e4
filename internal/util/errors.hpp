#pragma once

#include <stdexcept>
#include <string>

namespace netcrawl::util {

/*
  Central error types.

  Per-device errors (connection, command, parse) are absorbed by the crawl
  worker and recorded as claim status. ConfigError and store failures are
  fatal to the run.
*/

class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ConnectionError : public std::runtime_error {
 public:
  explicit ConnectionError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class CommandTimeoutError : public std::runtime_error {
 public:
  explicit CommandTimeoutError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class CommandError : public std::runtime_error {
 public:
  explicit CommandError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ParseError : public std::runtime_error {
 public:
  explicit ParseError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class TemplateError : public std::runtime_error {
 public:
  explicit TemplateError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StoreError : public std::runtime_error {
 public:
  explicit StoreError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace netcrawl::util
