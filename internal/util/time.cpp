#include "time.hpp"

#include <cstdio>
#include <ctime>

namespace airspace::util {

TimePoint Now() {
  return std::chrono::time_point_cast<std::chrono::microseconds>(Clock::now());
}

TimePoint FromUnixMicros(int64_t micros) {
  return TimePoint{std::chrono::microseconds(micros)};
}

int64_t ToUnixMicros(TimePoint tp) {
  return tp.time_since_epoch().count();
}

std::string FormatRfc3339(TimePoint tp) {
  auto       secs   = std::chrono::floor<std::chrono::seconds>(tp);
  const auto micros = (tp - secs).count();

  std::time_t t = Clock::to_time_t(secs);
  std::tm     utc{};
  gmtime_r(&t, &utc);

  char buf[40];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06lldZ", utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday, utc.tm_hour,
                utc.tm_min, utc.tm_sec, static_cast<long long>(micros));
  return buf;
}

} // namespace airspace::util
