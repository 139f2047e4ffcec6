#pragma once

#include "core/logging/color.hpp"
#include "core/logging/logger.hpp"
#include "runtime/bootstrapper.hpp"
#include "tasks/registry.hpp"

#include <functional>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace taskrun::cli {

// Runner configuration, built once at startup and read-only afterwards.
struct RunnerConfig {
  runtime::BootstrapPlan plan;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
  core::logging::ColorMode color_mode = core::logging::ColorMode::kAuto;
  // NO_COLOR convention; only consulted when color_mode is kAuto.
  bool no_color = false;
};

// Environment access, injectable for tests. Returns nullptr for unset names.
using EnvironmentLookup = std::function<const char*(const char*)>;

const char* ProcessEnvironment(const char* name);

// Splits command-line arguments (program name excluded): every argument that
// starts with '-' becomes a forwarded flag, everything else a task id. Order
// is kept in both lists. The runner consumes none of them itself.
void ParseCommandLine(const std::vector<std::string_view>& args, RunnerConfig& config);

// Reads runner settings that must not steal command-line flags from tasks:
//   TASKRUN_LOG_LEVEL  debug|info|warn|error
//   TASKRUN_COLOR      auto|always|never
//   NO_COLOR           any value disables color in auto mode
//
// Returns false with `error` set when a value is invalid.
bool ApplyEnvironment(const EnvironmentLookup& lookup, RunnerConfig& config, std::string& error);

// Process entry contract. Returns the exit code to hand back to the shell:
//   0      => success, or nothing to run
//   1      => a requested task is not defined (nothing ran)
//   2      => invalid runner configuration
//   N      => a sequential task failed with status N
//   41/42  => a parallel batch partially/fully failed (from the default task)
int Dispatch(int argc, char** argv, const tasks::TaskRegistry& registry,
             const tasks::TaskId& default_task);

// Same as above with explicit environment and output stream.
int Dispatch(int argc, char** argv, const tasks::TaskRegistry& registry,
             const tasks::TaskId& default_task, const EnvironmentLookup& lookup,
             std::ostream& out);

} // namespace taskrun::cli
