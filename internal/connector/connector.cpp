#include "connector.hpp"

namespace netcrawl::connector {

bool LooksLikeCommandError(const std::string& output) {
  return output.find("Invalid input") != std::string::npos || output.find("Incomplete command") != std::string::npos;
}

} // namespace netcrawl::connector
