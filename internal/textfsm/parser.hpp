#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "parse_record.hpp"
#include "template.hpp"

namespace netcrawl::textfsm {

/*
  Line-oriented state machine driven by a Template.

  Not thread-safe; each worker owns its own Parser. The Template itself is
  shared. ParseText() always restarts from `Start` with an empty record.
*/
class Parser {
 public:
  explicit Parser(std::shared_ptr<const Template> tpl);

  std::vector<ParseRecord> ParseText(std::string_view text);

  // Lines longer than this never reach a rule regex; std::regex recurses per character.
  static constexpr std::size_t kMaxLineLength = 4096;

  // Records skipped during the last ParseText() because a Required value was empty.
  std::size_t DroppedRecords() const { return dropped_; }

  // Lines over kMaxLineLength discarded during the last ParseText().
  std::size_t OversizedLines() const { return oversized_; }

 private:
  struct Slot {
    std::string              scalar;
    std::vector<std::string> list;

    bool Empty() const { return scalar.empty() && list.empty(); }
  };

  // kEof skips the remaining input but still runs end-of-input handling.
  enum class Flow { kNextLine, kEof, kEnd };

  void Reset();
  Flow ProcessLine(const std::string& line);
  void Assign(const Rule& rule, const std::smatch& match);
  void AppendRecord();
  void ClearRecord(bool all);

  std::shared_ptr<const Template> template_;
  const State*                    state_ = nullptr;
  std::vector<Slot>               slots_;
  std::vector<ParseRecord>        results_;
  std::size_t                     dropped_   = 0;
  std::size_t                     oversized_ = 0;
};

} // namespace netcrawl::textfsm
