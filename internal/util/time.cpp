#include "time.hpp"

#include <ctime>

namespace netcrawl::util {

TimePoint Now() {
  return Clock::now();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

uint64_t NowMs() {
  return ToUnixMillis(Now());
}

std::chrono::milliseconds FromProto(const google::protobuf::Duration& d, std::chrono::milliseconds fallback) {
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::seconds(d.seconds()) + std::chrono::nanoseconds(d.nanos()));
  if (ms.count() <= 0) return fallback;
  return ms;
}

std::string FormatIso8601(uint64_t unix_ms) {
  if (unix_ms == 0) return {};

  const std::time_t secs = static_cast<std::time_t>(unix_ms / 1000);
  std::tm           utc{};
  gmtime_r(&secs, &utc);

  char buf[32];
  const auto n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &utc);
  return std::string(buf, n);
}

} // namespace netcrawl::util
