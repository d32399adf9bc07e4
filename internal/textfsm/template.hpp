#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace netcrawl::textfsm {

enum class LineAction { kNext, kContinue, kError };

enum class RecordAction { kNoRecord, kRecord, kClear, kClearAll };

/*
  One `Value` line.

    Value Filldown,Required CHASSIS (\S+)

  `list` values append on every capture, all others overwrite.
  `filldown` values survive record emission.
*/
struct ValueDefinition {
  std::string name;
  std::string pattern;

  bool filldown = false;
  bool required = false;
  bool list     = false;
  bool key      = false;
};

struct Capture {
  std::size_t group = 0; // submatch index in Rule::regex
  std::size_t value = 0; // index into Template::Values()
};

struct Rule {
  std::string source;
  int         line_number = 0;

  std::regex           regex;
  std::vector<Capture> captures;

  LineAction   line_action   = LineAction::kNext;
  RecordAction record_action = RecordAction::kNoRecord;
  std::string  new_state;     // empty: stay
  std::string  error_message; // LineAction::kError only
};

struct State {
  std::string       name;
  std::vector<Rule> rules;
};

/*
  Compiled template. Immutable once parsed, so one instance is shared by
  every worker thread.

  File format (TextFSM dialect, ECMAScript regex):

    Value Required NEIGHBOR_NAME (\S+)
    Value List SERIAL (\S+)

    Start
      ^Device ID: -> Continue.Record
      ^Device ID:\s*${NEIGHBOR_NAME}
      ^Version\s*: -> GetVersion

  `$$` is a literal `$`. A `Start` state is mandatory. Declaring an empty
  `EOF` state suppresses the implicit record at end of input. Reaching
  `End` stops processing.
*/
class Template {
  struct PrivateTag {};

 public:
  // Reachable only through Parse()/FromFile(); public for std::make_shared.
  explicit Template(PrivateTag) {}

  static std::shared_ptr<const Template> Parse(std::string_view text, std::string name = "<inline>");
  static std::shared_ptr<const Template> FromFile(const std::string& path);

  const std::string&                  Name() const { return name_; }
  const std::vector<ValueDefinition>& Values() const { return values_; }
  const std::vector<State>&           States() const { return states_; }

  const State*               FindState(const std::string& name) const;
  std::optional<std::size_t> ValueIndex(const std::string& name) const;

  bool ImplicitEofRecord() const { return !has_eof_state_; }

 private:
  void ParseValueLine(const std::string& line, int line_number);
  Rule CompileRule(const std::string& line, int line_number) const;
  void Validate() const;

  [[noreturn]] void Fail(int line_number, const std::string& what) const;

  std::string                  name_;
  std::vector<ValueDefinition> values_;
  std::vector<State>           states_;
  bool                         has_eof_state_ = false;
};

// Capturing groups in an ECMAScript pattern, ignoring escapes, classes and (?...).
std::size_t CountCaptureGroups(std::string_view pattern);

// Splits on "\n", "\r\n" and a bare "\r". A trailing terminator adds no empty line.
std::vector<std::string> SplitLines(std::string_view text);

} // namespace netcrawl::textfsm
