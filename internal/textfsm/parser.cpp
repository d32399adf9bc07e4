#include "parser.hpp"

#include <sstream>

#include "internal/util/errors.hpp"

namespace netcrawl::textfsm {

Parser::Parser(std::shared_ptr<const Template> tpl) : template_(std::move(tpl)) {
  if (!template_) throw util::TemplateError("parser requires a template");
  Reset();
}

void Parser::Reset() {
  state_ = template_->FindState("Start");
  slots_.assign(template_->Values().size(), Slot{});
  results_.clear();
  dropped_   = 0;
  oversized_ = 0;
}

std::vector<ParseRecord> Parser::ParseText(std::string_view text) {
  Reset();

  Flow flow = Flow::kNextLine;
  for (const auto& line : SplitLines(text)) {
    if (flow != Flow::kNextLine) break;
    // discarded like a line no rule matches
    if (line.size() > kMaxLineLength) {
      ++oversized_;
      continue;
    }
    flow = ProcessLine(line);
  }

  if (flow != Flow::kEnd && template_->ImplicitEofRecord()) {
    AppendRecord();
  }

  return std::move(results_);
}

Parser::Flow Parser::ProcessLine(const std::string& line) {
  for (const auto& rule : state_->rules) {
    std::smatch match;
    if (!std::regex_search(line, match, rule.regex)) continue;

    Assign(rule, match);

    switch (rule.record_action) {
      case RecordAction::kRecord:
        AppendRecord();
        break;
      case RecordAction::kClear:
        ClearRecord(false);
        break;
      case RecordAction::kClearAll:
        ClearRecord(true);
        break;
      case RecordAction::kNoRecord:
        break;
    }

    if (rule.line_action == LineAction::kError) {
      std::ostringstream msg;
      msg << template_->Name() << ":" << rule.line_number << ": " << rule.error_message << " (input: '" << line << "')";
      throw util::ParseError(msg.str());
    }

    if (rule.line_action == LineAction::kContinue) continue;

    if (!rule.new_state.empty()) {
      if (rule.new_state == "End") return Flow::kEnd;
      if (rule.new_state == "EOF") return Flow::kEof;
      state_ = template_->FindState(rule.new_state);
    }
    return Flow::kNextLine;
  }
  return Flow::kNextLine;
}

void Parser::Assign(const Rule& rule, const std::smatch& match) {
  for (const auto& capture : rule.captures) {
    if (capture.group >= match.size() || !match[capture.group].matched) continue;

    auto&       slot = slots_[capture.value];
    const auto& def  = template_->Values()[capture.value];
    if (def.list) {
      slot.list.push_back(match[capture.group].str());
    } else {
      slot.scalar = match[capture.group].str();
    }
  }
}

void Parser::AppendRecord() {
  const auto& values = template_->Values();

  bool has_content = false;
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (!values[i].filldown && !slots_[i].Empty()) has_content = true;
  }
  if (!has_content) return;

  for (std::size_t i = 0; i < values.size(); ++i) {
    if (values[i].required && slots_[i].Empty()) {
      ++dropped_;
      ClearRecord(false);
      return;
    }
  }

  ParseRecord record;
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (values[i].list) {
      record.lists[values[i].name] = slots_[i].list;
    } else {
      record.scalars[values[i].name] = slots_[i].scalar;
    }
  }
  results_.push_back(std::move(record));

  ClearRecord(false);
}

void Parser::ClearRecord(bool all) {
  const auto& values = template_->Values();
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (all || !values[i].filldown) slots_[i] = Slot{};
  }
}

} // namespace netcrawl::textfsm
