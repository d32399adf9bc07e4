#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "internal/textfsm/template.hpp"

namespace netcrawl::runtime::config {
class TemplatesConfig;
}

namespace netcrawl::session {

/*
  Everything needed to identify a device of one family and list its
  neighbors. Templates are compiled once and shared by all workers.
*/
struct DeviceFamily {
  std::string name;

  std::string identify_command;
  std::string neighbors_command;

  std::shared_ptr<const textfsm::Template> identify_template;
  std::shared_ptr<const textfsm::Template> neighbors_template;
};

class FamilyRegistry {
 public:
  // Built-in cisco_ios / cisco_nxos, then families from config on top.
  // Throws util::TemplateError when a template does not load.
  static std::shared_ptr<const FamilyRegistry> Load(const netcrawl::runtime::config::TemplatesConfig& config);

  void Add(DeviceFamily family);

  bool Contains(const std::string& name) const;

  // util::ConfigError for an unknown family
  const DeviceFamily& Get(const std::string& name) const;

  std::vector<std::string> Names() const;

 private:
  std::map<std::string, DeviceFamily> families_;
};

// Directory searched when the config names none.
std::string DefaultTemplateDirectory();

} // namespace netcrawl::session
