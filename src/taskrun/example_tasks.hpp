#pragma once

#include "tasks/registry.hpp"

#include <string>

namespace taskrun {

// Default task selected when the command line names none.
inline constexpr const char* kExampleDefaultTask = "default";

// Registers the demo task set shipped with the `taskrun` binary:
//   clean, build, lint, test  leaf tasks
//   check                     lint and test in parallel
//   ci                        clean, build, check in sequence
//   default                   runs ci
//
// `--fail-build`, `--fail-lint` and `--fail-test` make the matching leaf task
// exit non-zero, which is handy for exercising the exit-code contract.
bool RegisterExampleTasks(tasks::TaskRegistry& registry, std::string& error);

} // namespace taskrun
