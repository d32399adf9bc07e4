#pragma once

#include <map>
#include <string>
#include <vector>

namespace netcrawl::textfsm {

/*
  One emitted result: value name -> scalar, or value name -> list for
  `List` values. Missing names read as empty.
*/
struct ParseRecord {
  std::map<std::string, std::string>              scalars;
  std::map<std::string, std::vector<std::string>> lists;

  const std::string& Get(const std::string& name) const {
    static const std::string kEmpty;
    auto                     it = scalars.find(name);
    return it == scalars.end() ? kEmpty : it->second;
  }

  const std::vector<std::string>& GetList(const std::string& name) const {
    static const std::vector<std::string> kEmpty;
    auto                                  it = lists.find(name);
    return it == lists.end() ? kEmpty : it->second;
  }
};

} // namespace netcrawl::textfsm
