#include "template.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <unordered_set>

#include "internal/util/errors.hpp"

namespace netcrawl::textfsm {

namespace {

const std::unordered_set<std::string> kReservedStates = {"End", "EOF"};

std::string TrimRight(std::string s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.pop_back();
  return s;
}

std::string TrimLeft(const std::string& s) {
  std::size_t i = 0;
  while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
  return s.substr(i);
}

bool IsBlank(const std::string& s) {
  return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

bool IsComment(const std::string& s) {
  auto t = TrimLeft(s);
  return !t.empty() && t.front() == '#';
}

bool IsIdentifier(const std::string& s) {
  if (s.empty()) return false;
  return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isalnum(c) || c == '_'; });
}

std::vector<std::string> SplitOn(const std::string& s, char sep) {
  std::vector<std::string> parts;
  std::string              part;
  std::istringstream       in(s);
  while (std::getline(in, part, sep)) parts.push_back(part);
  return parts;
}

std::optional<LineAction> ParseLineAction(const std::string& token) {
  if (token == "Next") return LineAction::kNext;
  if (token == "Continue") return LineAction::kContinue;
  if (token == "Error") return LineAction::kError;
  return std::nullopt;
}

std::optional<RecordAction> ParseRecordAction(const std::string& token) {
  if (token == "NoRecord") return RecordAction::kNoRecord;
  if (token == "Record") return RecordAction::kRecord;
  if (token == "Clear") return RecordAction::kClear;
  if (token == "Clearall") return RecordAction::kClearAll;
  return std::nullopt;
}

} // namespace

std::size_t CountCaptureGroups(std::string_view pattern) {
  std::size_t groups   = 0;
  bool        in_class = false;

  for (std::size_t i = 0; i < pattern.size(); ++i) {
    const char c = pattern[i];
    if (c == '\\') {
      ++i;
      continue;
    }
    if (in_class) {
      if (c == ']') in_class = false;
      continue;
    }
    if (c == '[') {
      in_class = true;
      // a leading ']' (or '^]') is a literal member
      if (i + 1 < pattern.size() && pattern[i + 1] == '^') ++i;
      if (i + 1 < pattern.size() && pattern[i + 1] == ']') ++i;
      continue;
    }
    if (c == '(' && (i + 1 >= pattern.size() || pattern[i + 1] != '?')) ++groups;
  }
  return groups;
}

std::vector<std::string> SplitLines(std::string_view text) {
  std::vector<std::string> lines;
  std::size_t              start = 0;
  for (std::size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    if (c != '\n' && c != '\r') continue;
    lines.emplace_back(text.substr(start, i - start));
    if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') ++i;
    start = i + 1;
  }
  if (start < text.size()) lines.emplace_back(text.substr(start));
  return lines;
}

void Template::Fail(int line_number, const std::string& what) const {
  std::ostringstream msg;
  msg << name_ << ":" << line_number << ": " << what;
  throw util::TemplateError(msg.str());
}

std::shared_ptr<const Template> Template::FromFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw util::TemplateError("template file not found: " + path);
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return Parse(buffer.str(), path);
}

std::shared_ptr<const Template> Template::Parse(std::string_view text, std::string name) {
  auto tpl = std::make_shared<Template>(PrivateTag{});
  tpl->name_ = std::move(name);

  const auto  lines = SplitLines(text);
  std::size_t i     = 0;

  // ------------------------------------------------------------
  // Value section: runs until the first blank line.
  // ------------------------------------------------------------
  for (; i < lines.size(); ++i) {
    const auto& line = lines[i];
    if (IsComment(line)) continue;
    if (IsBlank(line)) break;
    if (line.rfind("Value ", 0) != 0) {
      tpl->Fail(static_cast<int>(i + 1), "expected 'Value' definition, got '" + line + "'");
    }
    tpl->ParseValueLine(line, static_cast<int>(i + 1));
  }

  if (tpl->values_.empty()) {
    tpl->Fail(static_cast<int>(i + 1), "template defines no values");
  }

  // ------------------------------------------------------------
  // State blocks
  // ------------------------------------------------------------
  State* current = nullptr;
  for (; i < lines.size(); ++i) {
    const auto line = TrimRight(lines[i]);
    const int  lnum = static_cast<int>(i + 1);

    if (IsComment(line)) continue;
    if (line.empty()) {
      current = nullptr;
      continue;
    }

    if (!std::isspace(static_cast<unsigned char>(line.front()))) {
      if (!IsIdentifier(line)) tpl->Fail(lnum, "invalid state name '" + line + "'");
      if (tpl->FindState(line)) tpl->Fail(lnum, "duplicate state '" + line + "'");
      if (line == "EOF") tpl->has_eof_state_ = true;
      tpl->states_.push_back(State{line, {}});
      current = &tpl->states_.back();
      continue;
    }

    if (!current) tpl->Fail(lnum, "rule outside of a state block");
    if (kReservedStates.count(current->name)) tpl->Fail(lnum, "state '" + current->name + "' must be empty");

    current->rules.push_back(tpl->CompileRule(TrimLeft(line), lnum));
  }

  tpl->Validate();
  return tpl;
}

void Template::ParseValueLine(const std::string& line, int line_number) {
  std::istringstream in(line);
  std::string        keyword, first, second;
  in >> keyword >> first;

  ValueDefinition value;
  std::string     options;

  // "Value NAME (re)" or "Value Opt1,Opt2 NAME (re)"
  in >> std::ws;
  if (in.peek() == '(') {
    value.name = first;
  } else {
    in >> second;
    options    = first;
    value.name = second;
  }
  std::getline(in >> std::ws, value.pattern);
  value.pattern = TrimRight(value.pattern);

  if (!IsIdentifier(value.name)) Fail(line_number, "invalid value name '" + value.name + "'");
  if (ValueIndex(value.name)) Fail(line_number, "duplicate value '" + value.name + "'");
  if (value.pattern.size() < 2 || value.pattern.front() != '(' || value.pattern.back() != ')') {
    Fail(line_number, "value '" + value.name + "' pattern must be enclosed in parentheses");
  }

  if (!options.empty()) {
    for (const auto& option : SplitOn(options, ',')) {
      if (option == "Filldown") {
        value.filldown = true;
      } else if (option == "Required") {
        value.required = true;
      } else if (option == "List") {
        value.list = true;
      } else if (option == "Key") {
        value.key = true;
      } else {
        Fail(line_number, "unsupported value option '" + option + "'");
      }
    }
  }

  try {
    std::regex probe(value.pattern);
  } catch (const std::regex_error& e) {
    Fail(line_number, "value '" + value.name + "' has invalid pattern: " + e.what());
  }

  values_.push_back(std::move(value));
}

Rule Template::CompileRule(const std::string& line, int line_number) const {
  if (line.empty() || line.front() != '^') {
    Fail(line_number, "rule must start with '^': '" + line + "'");
  }

  Rule rule;
  rule.source      = line;
  rule.line_number = line_number;

  std::string match_part = line;
  std::string action_part;
  if (const auto arrow = line.rfind(" ->"); arrow != std::string::npos) {
    match_part  = TrimRight(line.substr(0, arrow));
    action_part = TrimLeft(line.substr(arrow + 3));
  }

  // ------------------------------------------------------------
  // Action: [LineOp][.RecordOp] [NewState | "error message"]
  // ------------------------------------------------------------
  if (!action_part.empty()) {
    std::string op   = action_part;
    std::string rest;
    if (const auto space = action_part.find_first_of(" \t"); space != std::string::npos) {
      op   = action_part.substr(0, space);
      rest = TrimLeft(action_part.substr(space));
    }

    bool have_op = true;
    if (const auto dot = op.find('.'); dot != std::string::npos) {
      auto line_op   = ParseLineAction(op.substr(0, dot));
      auto record_op = ParseRecordAction(op.substr(dot + 1));
      if (!line_op || !record_op) Fail(line_number, "invalid action '" + op + "'");
      rule.line_action   = *line_op;
      rule.record_action = *record_op;
    } else if (auto line_op = ParseLineAction(op)) {
      rule.line_action = *line_op;
    } else if (auto record_op = ParseRecordAction(op)) {
      rule.record_action = *record_op;
    } else {
      have_op = false;
    }

    if (!have_op) {
      if (!rest.empty()) Fail(line_number, "unexpected text after new state '" + op + "'");
      rest = op;
    }

    if (rule.line_action == LineAction::kError) {
      if (rest.size() >= 2 && rest.front() == '"' && rest.back() == '"') rest = rest.substr(1, rest.size() - 2);
      rule.error_message = rest.empty() ? "template error action: " + rule.source : rest;
    } else if (!rest.empty()) {
      if (!IsIdentifier(rest)) Fail(line_number, "invalid new state '" + rest + "'");
      if (rule.line_action == LineAction::kContinue) Fail(line_number, "Continue cannot change state");
      rule.new_state = rest;
    }
  }

  // ------------------------------------------------------------
  // Expand ${NAME} / $NAME placeholders; $$ is a literal '$'.
  // ------------------------------------------------------------
  std::string expanded;
  for (std::size_t i = 0; i < match_part.size(); ++i) {
    const char c = match_part[i];
    if (c != '$') {
      expanded.push_back(c);
      continue;
    }
    if (i + 1 < match_part.size() && match_part[i + 1] == '$') {
      expanded.push_back('$');
      ++i;
      continue;
    }

    std::string name;
    if (i + 1 < match_part.size() && match_part[i + 1] == '{') {
      const auto close = match_part.find('}', i + 2);
      if (close == std::string::npos) Fail(line_number, "unterminated ${ in rule");
      name = match_part.substr(i + 2, close - i - 2);
      i    = close;
    } else {
      std::size_t j = i + 1;
      while (j < match_part.size() && (std::isalnum(static_cast<unsigned char>(match_part[j])) || match_part[j] == '_')) ++j;
      name = match_part.substr(i + 1, j - i - 1);
      i    = j - 1;
    }

    if (name.empty()) {
      // lone '$' at end of a rule is an anchor
      expanded.push_back('$');
      continue;
    }

    const auto index = ValueIndex(name);
    if (!index) Fail(line_number, "rule references undefined value '" + name + "'");

    rule.captures.push_back(Capture{CountCaptureGroups(expanded) + 1, *index});
    expanded += values_[*index].pattern;
  }

  try {
    rule.regex = std::regex(expanded, std::regex::ECMAScript | std::regex::optimize);
  } catch (const std::regex_error& e) {
    Fail(line_number, "invalid rule pattern '" + expanded + "': " + e.what());
  }

  return rule;
}

void Template::Validate() const {
  if (!FindState("Start")) {
    throw util::TemplateError(name_ + ": missing 'Start' state");
  }

  for (const auto& state : states_) {
    for (const auto& rule : state.rules) {
      if (rule.new_state.empty()) continue;
      if (rule.new_state == "End" || rule.new_state == "EOF") continue;
      if (!FindState(rule.new_state)) {
        Fail(rule.line_number, "transition to undefined state '" + rule.new_state + "'");
      }
    }
  }
}

const State* Template::FindState(const std::string& name) const {
  for (const auto& state : states_) {
    if (state.name == name) return &state;
  }
  return nullptr;
}

std::optional<std::size_t> Template::ValueIndex(const std::string& name) const {
  for (std::size_t i = 0; i < values_.size(); ++i) {
    if (values_[i].name == name) return i;
  }
  return std::nullopt;
}

} // namespace netcrawl::textfsm
