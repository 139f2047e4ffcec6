#pragma once

#include "runtime/engine.hpp"
#include "tasks/task.hpp"

#include <atomic>

namespace taskrun::runtime {

enum class BootstrapState {
  kIdle,
  kResolving,
  kRunning,
  kDone,
};

const char* ToString(BootstrapState state);

// What to run, as decided by the command line and the embedding program.
struct BootstrapPlan {
  // Positional command-line arguments. Always run as one sequence.
  tasks::TaskList tasks;
  // Dash-prefixed command-line arguments, forwarded to every task.
  tasks::Flags flags;
  // Run when `tasks` is empty and this id is registered.
  tasks::TaskId default_task = "default";
};

// One-shot top-level decision: explicit task list, else the default task,
// else a task listing. Owns the process exit code.
//
// Only the first Run() does anything; later calls return the first exit code
// without running tasks again. The returned code always fits a process exit
// status: a failing task never maps to 0.
class Bootstrapper {
public:
  explicit Bootstrapper(Engine& engine);

  int Run(const BootstrapPlan& plan);

  BootstrapState State() const {
    return state_.load();
  }

  // Exit code of the completed run; 0 before Run() has finished.
  int ExitCode() const {
    return exit_code_.load();
  }

private:
  int Resolve(const BootstrapPlan& plan);
  int Finish(int status);

  Engine& engine_;
  std::atomic<BootstrapState> state_{BootstrapState::kIdle};
  std::atomic<int> exit_code_{0};
};

} // namespace taskrun::runtime
