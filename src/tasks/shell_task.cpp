#include "tasks/shell_task.hpp"

#include "tasks/task_context.hpp"

#include <cstdlib>
#include <utility>

#if !defined(_WIN32)
#include <sys/wait.h>
#endif

namespace taskrun::tasks {

std::string QuoteShellArgument(std::string_view argument) {
  std::string quoted = "'";
  for (const char c : argument) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted.push_back(c);
    }
  }
  quoted += '\'';
  return quoted;
}

std::string BuildShellCommandLine(std::string_view command, const Flags& flags) {
  std::string command_line(command);
  for (const auto& flag : flags) {
    command_line += ' ';
    command_line += QuoteShellArgument(flag);
  }
  return command_line;
}

bool RunShellCommand(const std::string& command_line, int& exit_code, std::string& error) {
  error.clear();
  exit_code = kShellLaunchFailedExitCode;
  const int raw_status = std::system(command_line.c_str());
  if (raw_status == -1) {
    error = "failed to execute shell command";
    return false;
  }

#if defined(_WIN32)
  exit_code = raw_status;
#else
  if (WIFEXITED(raw_status)) {
    exit_code = WEXITSTATUS(raw_status);
  } else if (WIFSIGNALED(raw_status)) {
    exit_code = 128 + WTERMSIG(raw_status);
  } else {
    exit_code = raw_status;
  }
#endif
  return true;
}

Runnable MakeShellTask(std::string command) {
  return [command = std::move(command)](TaskContext& context) -> int {
    const std::string command_line = BuildShellCommandLine(command, context.ForwardedFlags());
    context.Log().Debug("running shell command", {{"task", context.Id()}, {"command", command_line}});

    int exit_code = kShellLaunchFailedExitCode;
    std::string error;
    if (!RunShellCommand(command_line, exit_code, error)) {
      context.Log().Error("Task '" + context.Id() + "' could not start its command: " + error);
      return kShellLaunchFailedExitCode;
    }
    return exit_code;
  };
}

} // namespace taskrun::tasks
