#include "core/logging/color.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <iostream>

#if defined(__linux__) || defined(__APPLE__)
#include <unistd.h>
#endif

namespace taskrun::core::logging {

namespace {

struct ColorEntry {
  Color color;
  std::string_view escape;
};

constexpr std::array<ColorEntry, 17> kColorTable = {{
    {Color::kBlack, "\x1b[30m"},
    {Color::kRed, "\x1b[31m"},
    {Color::kGreen, "\x1b[32m"},
    {Color::kBrown, "\x1b[33m"},
    {Color::kBlue, "\x1b[34m"},
    {Color::kPurple, "\x1b[35m"},
    {Color::kCyan, "\x1b[36m"},
    {Color::kLightGray, "\x1b[37m"},
    {Color::kGray, "\x1b[90m"},
    {Color::kLightRed, "\x1b[91m"},
    {Color::kLightGreen, "\x1b[92m"},
    {Color::kYellow, "\x1b[93m"},
    {Color::kLightBlue, "\x1b[94m"},
    {Color::kLightPurple, "\x1b[95m"},
    {Color::kLightCyan, "\x1b[96m"},
    {Color::kWhite, "\x1b[97m"},
    {Color::kReset, "\x1b[0m"},
}};

const ColorEntry& LookupEntry(Color color) {
  const auto it = std::find_if(kColorTable.begin(), kColorTable.end(),
                               [color](const ColorEntry& entry) { return entry.color == color; });
  if (it == kColorTable.end()) {
    return kColorTable.back();
  }
  return *it;
}

std::string Lowercase(std::string_view raw) {
  std::string normalized(raw);
  std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return normalized;
}

bool IsTerminal(const std::ostream& out) {
#if defined(__linux__) || defined(__APPLE__)
  if (out.rdbuf() == std::cout.rdbuf()) {
    return isatty(STDOUT_FILENO) != 0;
  }
  if (out.rdbuf() == std::cerr.rdbuf() || out.rdbuf() == std::clog.rdbuf()) {
    return isatty(STDERR_FILENO) != 0;
  }
#else
  (void)out;
#endif
  return false;
}

} // namespace

const char* ToString(ColorMode mode) {
  switch (mode) {
  case ColorMode::kAuto:
    return "auto";
  case ColorMode::kAlways:
    return "always";
  case ColorMode::kNever:
    return "never";
  }

  return "auto";
}

std::string_view EscapeSequence(Color color) {
  return LookupEntry(color).escape;
}

bool ParseColorMode(std::string_view raw, ColorMode& mode, std::string& error) {
  error.clear();

  if (raw.empty()) {
    error = "missing value for TASKRUN_COLOR (expected auto|always|never)";
    return false;
  }

  const std::string normalized = Lowercase(raw);
  if (normalized == "auto") {
    mode = ColorMode::kAuto;
    return true;
  }
  if (normalized == "always") {
    mode = ColorMode::kAlways;
    return true;
  }
  if (normalized == "never") {
    mode = ColorMode::kNever;
    return true;
  }

  error = "invalid TASKRUN_COLOR '" + std::string(raw) + "' (expected auto|always|never)";
  return false;
}

std::string Colorize(Color color, std::string_view text, bool enabled) {
  if (!enabled) {
    return std::string(text);
  }

  std::string colored;
  const std::string_view open = EscapeSequence(color);
  const std::string_view close = EscapeSequence(Color::kReset);
  colored.reserve(open.size() + text.size() + close.size());
  colored.append(open);
  colored.append(text);
  colored.append(close);
  return colored;
}

bool ResolveColorEnabled(ColorMode mode, const std::ostream& out, bool no_color_env) {
  switch (mode) {
  case ColorMode::kAlways:
    return true;
  case ColorMode::kNever:
    return false;
  case ColorMode::kAuto:
    return !no_color_env && IsTerminal(out);
  }

  return false;
}

} // namespace taskrun::core::logging
