#ifndef TASKRUN_CORE_TIME_UTILS_HPP_
#define TASKRUN_CORE_TIME_UTILS_HPP_

#include <chrono>
#include <cstdint>
#include <ctime>
#include <functional>
#include <iomanip>
#include <sstream>
#include <string>

namespace taskrun::core {

// Millisecond clock used to time task runs. Injectable so tests can drive
// elapsed-time accounting deterministically.
using MillisClock = std::function<std::int64_t()>;

inline std::int64_t SteadyNowMillis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now().time_since_epoch())
      .count();
}

// Clock resolution (or an injected clock) may report end < start; durations
// are never negative.
inline std::int64_t ElapsedMillis(std::int64_t start_ms, std::int64_t end_ms) {
  if (end_ms < start_ms) {
    return 0;
  }
  return end_ms - start_ms;
}

// Local wall-clock time as HH:MM:SS, used as the log line prefix.
inline std::string FormatClockTime(std::chrono::system_clock::time_point timestamp) {
  const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(timestamp);
  std::tm local_time{};
#if defined(_WIN32)
  const errno_t result = localtime_s(&local_time, &epoch_seconds);
  if (result != 0) {
    return "--:--:--";
  }
#else
  const std::tm* result = localtime_r(&epoch_seconds, &local_time);
  if (result == nullptr) {
    return "--:--:--";
  }
#endif

  std::ostringstream out;
  out << std::put_time(&local_time, "%H:%M:%S");
  return out.str();
}

// Human readable duration:
//   < 1 ms     -> "0 ms"
//   < 1 s      -> "742 ms"
//   < 1 min    -> "1.50 s" (four significant characters)
//   otherwise  -> "1 d 2 h 3 m 4 s", zero components omitted
inline std::string FormatDuration(std::int64_t ms) {
  if (ms < 1) {
    return "0 ms";
  }
  if (ms < 1000) {
    return std::to_string(ms) + " ms";
  }
  if (ms < 60000) {
    std::ostringstream seconds;
    seconds << ms / 1000 << '.' << std::setw(3) << std::setfill('0') << ms % 1000;
    return seconds.str().substr(0, 4) + " s";
  }

  std::string result;
  const auto append_component = [&result](std::int64_t value, const char* unit) {
    if (value <= 0) {
      return;
    }
    if (!result.empty()) {
      result += ' ';
    }
    result += std::to_string(value);
    result += ' ';
    result += unit;
  };

  append_component(ms / 86400000, "d");
  append_component(ms / 3600000 % 24, "h");
  append_component(ms / 60000 % 60, "m");
  append_component(ms / 1000 % 60, "s");
  return result;
}

} // namespace taskrun::core

#endif // TASKRUN_CORE_TIME_UTILS_HPP_
