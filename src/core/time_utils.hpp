#ifndef PLUGEVAL_CORE_TIME_UTILS_HPP_
#define PLUGEVAL_CORE_TIME_UTILS_HPP_

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace plugeval::core {

// Canonical UTC timestamp formatter used by result documents and log lines.
inline std::string FormatUtcTimestamp(std::chrono::system_clock::time_point timestamp) {
  const auto millis_since_epoch =
      std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
  const auto millis_component = static_cast<int>((millis_since_epoch % 1000 + 1000) % 1000);

  const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(timestamp);
  std::tm utc_time{};
#if defined(_WIN32)
  const errno_t result = gmtime_s(&utc_time, &epoch_seconds);
  if (result != 0) {
    return "";
  }
#else
  const std::tm* result = gmtime_r(&epoch_seconds, &utc_time);
  if (result == nullptr) {
    return "";
  }
#endif

  std::ostringstream out;
  out << std::put_time(&utc_time, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis_component << 'Z';
  return out.str();
}

// Local wall-clock time as `YYYY-MM-DD HH:MM:SS`. The remote platform records
// completion times in the host's local zone, so window boundaries use it too.
inline std::string FormatLocalTimestamp(std::chrono::system_clock::time_point timestamp) {
  const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(timestamp);
  std::tm local_time{};
#if defined(_WIN32)
  const errno_t result = localtime_s(&local_time, &epoch_seconds);
  if (result != 0) {
    return "";
  }
#else
  const std::tm* result = localtime_r(&epoch_seconds, &local_time);
  if (result == nullptr) {
    return "";
  }
#endif

  std::ostringstream out;
  out << std::put_time(&local_time, "%Y-%m-%d %H:%M:%S");
  return out.str();
}

} // namespace plugeval::core

#endif // PLUGEVAL_CORE_TIME_UTILS_HPP_
