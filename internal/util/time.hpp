#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "google/protobuf/duration.pb.h"

namespace netcrawl::util {

/*
  Time utilities; the one place that reads the clock.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);
uint64_t NowMs();

// Duration from config; `fallback` when the field is unset or zero.
std::chrono::milliseconds FromProto(const google::protobuf::Duration& d, std::chrono::milliseconds fallback);

// 2024-01-31T12:00:00Z, empty for 0.
std::string FormatIso8601(uint64_t unix_ms);

} // namespace netcrawl::util
