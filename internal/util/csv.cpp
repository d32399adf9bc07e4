#include "csv.hpp"

namespace netcrawl::util {

std::string CsvEscape(const std::string& field) {
  if (field.find_first_of(",\"\r\n") == std::string::npos) return field;

  std::string quoted;
  quoted.reserve(field.size() + 2);
  quoted.push_back('"');
  for (char c : field) {
    if (c == '"') quoted.push_back('"');
    quoted.push_back(c);
  }
  quoted.push_back('"');
  return quoted;
}

void WriteCsvRow(std::ostream& out, const std::vector<std::string>& fields) {
  for (std::size_t i = 0; i < fields.size(); ++i) {
    if (i > 0) out << ',';
    out << CsvEscape(fields[i]);
  }
  out << "\n";
}

std::string Join(const std::vector<std::string>& values, const std::string& separator) {
  std::string out;
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) out += separator;
    out += values[i];
  }
  return out;
}

std::vector<std::string> Split(const std::string& joined, char separator) {
  std::vector<std::string> out;
  if (joined.empty()) return out;

  std::size_t start = 0;
  while (true) {
    const auto pos = joined.find(separator, start);
    if (pos == std::string::npos) {
      out.push_back(joined.substr(start));
      break;
    }
    out.push_back(joined.substr(start, pos - start));
    start = pos + 1;
  }
  return out;
}

} // namespace netcrawl::util
