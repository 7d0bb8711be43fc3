#ifndef TIME_UTILS_H
#define TIME_UTILS_H

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace TimeUtils {

inline std::string formatTimestamp(std::chrono::system_clock::time_point tp) {
  auto time_t = std::chrono::system_clock::to_time_t(tp);
  std::stringstream ss;
  struct tm tm_buf;
  std::tm *tm_ptr = localtime_r(&time_t, &tm_buf);
  if (!tm_ptr) {
    return "";
  }
  ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
  return ss.str();
}

inline std::string getCurrentTimestamp() {
  return formatTimestamp(std::chrono::system_clock::now());
}

inline std::string formatDurationMs(int64_t ms) {
  std::ostringstream ss;
  if (ms < 1000) {
    ss << ms << "ms";
  } else {
    ss << std::fixed << std::setprecision(2) << (ms / 1000.0) << "s";
  }
  return ss.str();
}

// Human readable byte count, base 1024 like pg_size_pretty.
inline std::string formatBytes(int64_t bytes) {
  const char *units[] = {"B", "kB", "MB", "GB", "TB"};
  double value = static_cast<double>(bytes);
  int index = 0;
  while (value >= 1024.0 && index < 4) {
    value /= 1024.0;
    ++index;
  }
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(index == 0 ? 0 : 1) << value << " "
     << units[index];
  return ss.str();
}

} // namespace TimeUtils

#endif
