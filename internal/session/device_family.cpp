#include "device_family.hpp"

#include <cstdlib>
#include <filesystem>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

#ifndef NETCRAWL_TEMPLATE_DIR
#define NETCRAWL_TEMPLATE_DIR "templates"
#endif

namespace netcrawl::session {

namespace {

struct BuiltinFamily {
  const char* name;
  const char* identify_command;
  const char* neighbors_command;
  const char* identify_template;
  const char* neighbors_template;
};

const BuiltinFamily kBuiltinFamilies[] = {
    {"cisco_ios", "show version", "show cdp neighbors detail", "cisco_ios_show_version.textfsm",
     "cisco_ios_show_cdp_neighbors_detail.textfsm"},
    {"cisco_nxos", "show version", "show cdp neighbors detail", "cisco_nxos_show_version.textfsm",
     "cisco_nxos_show_cdp_neighbors_detail.textfsm"},
};

std::shared_ptr<const textfsm::Template> LoadTemplate(const std::string& directory, const std::string& file) {
  std::filesystem::path path(file);
  if (path.is_relative()) path = std::filesystem::path(directory) / path;
  return textfsm::Template::FromFile(path.string());
}

} // namespace

std::string DefaultTemplateDirectory() {
  if (const char* dir = std::getenv("NETCRAWL_TEMPLATE_DIR")) {
    return dir;
  }
  return NETCRAWL_TEMPLATE_DIR;
}

std::shared_ptr<const FamilyRegistry> FamilyRegistry::Load(const netcrawl::runtime::config::TemplatesConfig& config) {
  const auto directory = config.directory().empty() ? DefaultTemplateDirectory() : config.directory();

  auto registry = std::make_shared<FamilyRegistry>();

  for (const auto& builtin : kBuiltinFamilies) {
    if (config.families().count(builtin.name) > 0) continue;

    DeviceFamily family;
    family.name               = builtin.name;
    family.identify_command   = builtin.identify_command;
    family.neighbors_command  = builtin.neighbors_command;
    family.identify_template  = LoadTemplate(directory, builtin.identify_template);
    family.neighbors_template = LoadTemplate(directory, builtin.neighbors_template);
    registry->Add(std::move(family));
  }

  for (const auto& kv : config.families()) {
    const auto& name  = kv.first;
    const auto& entry = kv.second;
    if (entry.identify_command().empty() || entry.neighbors_command().empty()) {
      throw util::ConfigError("family '" + name + "' needs identify_command and neighbors_command");
    }
    if (entry.identify_template().empty() || entry.neighbors_template().empty()) {
      throw util::ConfigError("family '" + name + "' needs identify_template and neighbors_template");
    }

    DeviceFamily family;
    family.name               = name;
    family.identify_command   = entry.identify_command();
    family.neighbors_command  = entry.neighbors_command();
    family.identify_template  = LoadTemplate(directory, entry.identify_template());
    family.neighbors_template = LoadTemplate(directory, entry.neighbors_template());
    registry->Add(std::move(family));
  }

  NETCRAWL_LOG_INFO("device families loaded", {observability::StringField("directory", directory),
                                                observability::IntField("count", static_cast<int64_t>(registry->families_.size()))});
  return registry;
}

void FamilyRegistry::Add(DeviceFamily family) {
  auto name       = family.name;
  families_[name] = std::move(family);
}

bool FamilyRegistry::Contains(const std::string& name) const {
  return families_.contains(name);
}

const DeviceFamily& FamilyRegistry::Get(const std::string& name) const {
  auto it = families_.find(name);
  if (it == families_.end()) {
    throw util::ConfigError("unknown device family '" + name + "'");
  }
  return it->second;
}

std::vector<std::string> FamilyRegistry::Names() const {
  std::vector<std::string> names;
  for (const auto& [name, _] : families_) names.push_back(name);
  return names;
}

} // namespace netcrawl::session
