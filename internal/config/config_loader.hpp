#pragma once

#include <string>

#include "config/config.pb.h"

namespace netcrawl::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf, so unknown keys and
  wrongly typed values are rejected. Every failure is a util::ConfigError.
*/
class ConfigLoader {
 public:
  static netcrawl::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static netcrawl::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

/*
  Fills unset fields with defaults, then rejects configurations a crawl
  cannot start from: no seed, no username, no password, zero workers,
  malformed family overrides.
*/
void ApplyDefaults(netcrawl::runtime::config::RuntimeConfig& config);
void ValidateConfig(const netcrawl::runtime::config::RuntimeConfig& config);

// credentials.password, else the variable named by credentials.password_env.
std::string ResolvePassword(const netcrawl::runtime::config::RuntimeConfig& config);

} // namespace netcrawl::config
