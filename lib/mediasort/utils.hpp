/**
 * @file utils.hpp
 * @brief Small formatting and naming helpers shared across the engine
 *
 * Key utilities:
 * - formatBytes: Human-readable file size formatting
 * - timestampString: Local-time stamp used in backup and snapshot names
 * - randomHex: Short random suffix for unique names
 */

#ifndef UTILS_HPP
#define UTILS_HPP

#include <chrono>
#include <cstddef>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>

/**
 * @brief Formats byte count into human-readable size string
 *
 * Uses binary units (1024 bytes = 1 KB) with one decimal place.
 *
 * Example outputs:
 * - formatBytes(0) → "0 B"
 * - formatBytes(1536) → "1.5 KB"
 * - formatBytes(1048576) → "1.0 MB"
 */
inline std::string formatBytes(long long bytes) {
  if (bytes == 0)
    return "0 B";

  const char *units[] = {"B", "KB", "MB", "GB", "TB"};
  int unit = 0;
  double size = static_cast<double>(bytes);

  while (size >= 1024.0 && unit < 4) {
    size /= 1024.0;
    unit++;
  }

  char buf[32];
  snprintf(buf, sizeof(buf), "%.1f %s", size, units[unit]);
  return std::string(buf);
}

/**
 * @brief Formats a point in time as local "YYYYmmdd_HHMMSS"
 */
inline std::string timestampString(std::chrono::system_clock::time_point tp =
                                       std::chrono::system_clock::now()) {
  std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  localtime_r(&t, &tm);
  std::ostringstream out;
  out << std::put_time(&tm, "%Y%m%d_%H%M%S");
  return out.str();
}

/**
 * @brief Returns @p length random lower-case hex digits
 */
inline std::string randomHex(std::size_t length = 8) {
  static thread_local std::mt19937_64 engine{std::random_device{}()};
  std::uniform_int_distribution<int> digit(0, 15);
  const char *hex = "0123456789abcdef";
  std::string out;
  out.reserve(length);
  for (std::size_t i = 0; i < length; ++i)
    out.push_back(hex[digit(engine)]);
  return out;
}

#endif // UTILS_HPP
