#include "portico/core/time.h"

#include <cstdio>
#include <ctime>
#include <random>

namespace portico::core {

std::int64_t now_unix_ms() {
  return (kj::systemPreciseCalendarClock().now() - kj::UNIX_EPOCH) / kj::MILLISECONDS;
}

kj::String format_iso8601(kj::Date date) {
  int64_t ms = (date - kj::UNIX_EPOCH) / kj::MILLISECONDS;
  time_t seconds = static_cast<time_t>(ms / 1000);
  std::tm tm{};
  gmtime_r(&seconds, &tm);

  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ", tm.tm_year + 1900,
                tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec,
                static_cast<int>(ms % 1000));
  return kj::str(buf);
}

kj::String now_utc_iso8601() {
  return format_iso8601(kj::systemPreciseCalendarClock().now());
}

kj::String generate_id() {
  static constexpr char ALPHABET[] = "0123456789abcdefghijklmnopqrstuvwxyz";
  thread_local std::mt19937_64 rng{std::random_device{}()};
  std::uniform_int_distribution<int> dist(0, 35);

  char suffix[10];
  for (int i = 0; i < 9; ++i) {
    suffix[i] = ALPHABET[dist(rng)];
  }
  suffix[9] = '\0';
  return kj::str(now_unix_ms(), "-", suffix);
}

} // namespace portico::core
