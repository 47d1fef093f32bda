#include "time.hpp"

#include <cstdio>
#include <ctime>

namespace lieko::util {

TimePoint Now() {
  return Clock::now();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::string ToIso8601(TimePoint tp) {
  return ToIso8601(ToUnixMillis(tp));
}

std::string ToIso8601(uint64_t unix_ms) {
  const auto seconds = static_cast<std::time_t>(unix_ms / 1000);
  std::tm    utc{};
  gmtime_r(&seconds, &utc);

  char date[32];
  std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &utc);

  char out[48];
  std::snprintf(out, sizeof(out), "%s.%03uZ", date, static_cast<unsigned>(unix_ms % 1000));
  return out;
}

} // namespace lieko::util
