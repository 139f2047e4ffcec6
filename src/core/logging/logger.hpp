#pragma once

#include "core/logging/color.hpp"
#include "core/time_utils.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <initializer_list>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace taskrun::core::logging {

enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

struct LogFieldView {
  std::string_view key;
  std::string_view value;
};

inline const char* ToString(LogLevel level) {
  switch (level) {
  case LogLevel::kDebug:
    return "DEBUG";
  case LogLevel::kInfo:
    return "INFO";
  case LogLevel::kWarn:
    return "WARN";
  case LogLevel::kError:
    return "ERROR";
  }

  return "INFO";
}

inline std::string ExpectedLogLevelList() {
  return "debug|info|warn|error";
}

inline bool ParseLogLevel(std::string_view raw, LogLevel& level, std::string& error) {
  error.clear();

  if (raw.empty()) {
    error = "missing value for TASKRUN_LOG_LEVEL (expected " + ExpectedLogLevelList() + ")";
    return false;
  }

  std::string normalized(raw);
  std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  if (normalized == "debug") {
    level = LogLevel::kDebug;
    return true;
  }
  if (normalized == "info") {
    level = LogLevel::kInfo;
    return true;
  }
  if (normalized == "warn" || normalized == "warning") {
    level = LogLevel::kWarn;
    return true;
  }
  if (normalized == "error") {
    level = LogLevel::kError;
    return true;
  }

  error = "invalid TASKRUN_LOG_LEVEL '" + std::string(raw) +
          "' (expected " + ExpectedLogLevelList() + ")";
  return false;
}

// Line-oriented runner output: `[HH:MM:SS] message key="value"`.
//
// Tasks of one parallel batch share a logger, so each line is written under a
// mutex and lines from different tasks never interleave mid-line.
class Logger {
public:
  explicit Logger(LogLevel min_level = LogLevel::kInfo, std::ostream& out = std::cout)
      : min_level_(min_level), out_(&out) {}

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  void SetMinLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mu_);
    min_level_ = level;
  }

  LogLevel MinLevel() const {
    std::lock_guard<std::mutex> lock(mu_);
    return min_level_;
  }

  void SetColorEnabled(bool enabled) {
    std::lock_guard<std::mutex> lock(mu_);
    color_enabled_ = enabled;
  }

  bool ColorEnabled() const {
    std::lock_guard<std::mutex> lock(mu_);
    return color_enabled_;
  }

  // Colors a fragment for embedding in a message (task names, durations).
  std::string Paint(Color color, std::string_view text) const {
    return Colorize(color, text, ColorEnabled());
  }

  // Renders one line without writing it. The message tint follows the level:
  // errors red, warnings yellow, everything else uncolored.
  std::string FormatLine(LogLevel level,
                         std::string_view message,
                         std::initializer_list<LogFieldView> fields = {}) const {
    return Render(TintFor(level), message, fields, ColorEnabled());
  }

  void Log(LogLevel level,
           std::string_view message,
           std::initializer_list<LogFieldView> fields = {}) {
    Emit(level, TintFor(level), message, fields);
  }

  void Debug(std::string_view message,
             std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kDebug, message, fields);
  }

  void Info(std::string_view message,
            std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kInfo, message, fields);
  }

  // Info-level line rendered green.
  void Success(std::string_view message,
               std::initializer_list<LogFieldView> fields = {}) {
    Emit(LogLevel::kInfo, Color::kGreen, message, fields);
  }

  void Warn(std::string_view message,
            std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kWarn, message, fields);
  }

  void Error(std::string_view message,
             std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kError, message, fields);
  }

private:
  static std::optional<Color> TintFor(LogLevel level) {
    switch (level) {
    case LogLevel::kError:
      return Color::kRed;
    case LogLevel::kWarn:
      return Color::kYellow;
    case LogLevel::kDebug:
    case LogLevel::kInfo:
      break;
    }
    return std::nullopt;
  }

  void Emit(LogLevel level,
            std::optional<Color> tint,
            std::string_view message,
            std::initializer_list<LogFieldView> fields) {
    std::lock_guard<std::mutex> lock(mu_);
    if (static_cast<int>(level) < static_cast<int>(min_level_)) {
      return;
    }

    (*out_) << Render(tint, message, fields, color_enabled_) << '\n';
    out_->flush();
  }

  static std::string Render(std::optional<Color> tint,
                            std::string_view message,
                            std::initializer_list<LogFieldView> fields,
                            bool color_enabled) {
    std::string line = "[";
    line += Colorize(Color::kGray, FormatClockTime(std::chrono::system_clock::now()), color_enabled);
    line += "] ";
    if (tint.has_value()) {
      line += Colorize(tint.value(), message, color_enabled);
    } else {
      line.append(message);
    }

    for (const auto& field : fields) {
      line += ' ';
      line.append(field.key);
      line += '=';
      line += Quote(field.value);
    }
    return line;
  }

  static std::string EscapeForQuoted(std::string_view raw) {
    std::string escaped;
    escaped.reserve(raw.size());

    for (const char c : raw) {
      switch (c) {
      case '\\':
        escaped += "\\\\";
        break;
      case '"':
        escaped += "\\\"";
        break;
      case '\n':
        escaped += "\\n";
        break;
      case '\r':
        escaped += "\\r";
        break;
      case '\t':
        escaped += "\\t";
        break;
      default:
        escaped.push_back(c);
        break;
      }
    }

    return escaped;
  }

  static std::string Quote(std::string_view raw) {
    return std::string("\"") + EscapeForQuoted(raw) + "\"";
  }

  mutable std::mutex mu_;
  LogLevel min_level_ = LogLevel::kInfo;
  std::ostream* out_ = &std::cout;
  bool color_enabled_ = false;
};

} // namespace taskrun::core::logging
