#pragma once

#include "tasks/task.hpp"

#include <string>
#include <string_view>

namespace taskrun::tasks {

// Exit status reported when the shell itself cannot be started.
inline constexpr int kShellLaunchFailedExitCode = 127;

// Quotes one argument for POSIX `sh` using single quotes.
std::string QuoteShellArgument(std::string_view argument);

// `command` followed by every forwarded flag, each quoted.
std::string BuildShellCommandLine(std::string_view command, const Flags& flags);

// Runs a command line through the system shell without capturing output.
//
// Contract:
// - true: the shell ran; `exit_code` holds the command's exit status.
// - false: the shell could not be launched; `error` explains why.
bool RunShellCommand(const std::string& command_line, int& exit_code, std::string& error);

// Task body that runs `command` through the shell with the task's flags
// appended and returns its exit status.
Runnable MakeShellTask(std::string command);

} // namespace taskrun::tasks
