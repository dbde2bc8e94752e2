#include "TimeFormat.hpp"

#include <cstdio>
#include <ctime>

namespace rsb {

std::string format_utc(int64_t unixSeconds) {
  const std::time_t t = static_cast<std::time_t>(unixSeconds);
  std::tm tm{};
#ifdef _WIN32
  gmtime_s(&tm, &t);
#else
  gmtime_r(&t, &tm);
#endif
  char buf[32];
  const size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S UTC", &tm);
  return std::string(buf, n);
}

std::string human_size(uint64_t n) {
  static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
  double v = static_cast<double>(n);
  char buf[48];
  for (const char* unit : units) {
    if (v < 1024) {
      if (unit == units[0]) std::snprintf(buf, sizeof(buf), "%llu B", static_cast<unsigned long long>(n));
      else std::snprintf(buf, sizeof(buf), "%.2f %s", v, unit);
      return buf;
    }
    v /= 1024;
  }
  std::snprintf(buf, sizeof(buf), "%.2f PB", v);
  return buf;
}

} // namespace rsb
