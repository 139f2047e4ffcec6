#pragma once

#include <ostream>
#include <string>
#include <string_view>

namespace taskrun::core::logging {

// Terminal palette used by runner output. Names follow the classic 16-color
// ANSI table; `kReset` clears any active attribute.
enum class Color {
  kBlack,
  kRed,
  kGreen,
  kBrown,
  kBlue,
  kPurple,
  kCyan,
  kLightGray,
  kGray,
  kLightRed,
  kLightGreen,
  kYellow,
  kLightBlue,
  kLightPurple,
  kLightCyan,
  kWhite,
  kReset,
};

// Whether escape sequences are written. `kAuto` resolves against the output
// stream and the NO_COLOR convention at startup.
enum class ColorMode {
  kAuto,
  kAlways,
  kNever,
};

const char* ToString(ColorMode mode);

// Raw escape sequence for one color, e.g. "\x1b[36m" for cyan.
std::string_view EscapeSequence(Color color);

bool ParseColorMode(std::string_view raw, ColorMode& mode, std::string& error);

// Wraps `text` in the color escape and a trailing reset. Returns `text`
// untouched when `enabled` is false.
std::string Colorize(Color color, std::string_view text, bool enabled);

// Decides whether color output is on for `out`.
// `kAuto` requires a terminal-backed stdout/stderr stream and no NO_COLOR.
bool ResolveColorEnabled(ColorMode mode, const std::ostream& out, bool no_color_env);

} // namespace taskrun::core::logging
