#pragma once

#include <ostream>
#include <string>
#include <vector>

namespace netcrawl::util {

// RFC 4180: fields with a comma, quote or line break are quoted, quotes doubled.
std::string CsvEscape(const std::string& field);

void WriteCsvRow(std::ostream& out, const std::vector<std::string>& fields);

std::string Join(const std::vector<std::string>& values, const std::string& separator);

// Inverse of Join; an empty input yields no elements.
std::vector<std::string> Split(const std::string& joined, char separator);

} // namespace netcrawl::util
