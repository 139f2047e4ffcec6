#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace taskrun::tasks {

// Process-unique name of a runnable unit, as typed on the command line.
using TaskId = std::string;

// Dash-prefixed command-line arguments, forwarded verbatim to every task.
using Flags = std::vector<std::string>;

// Ordered task selection. Order is execution order for sequences and launch
// order for parallel batches.
using TaskList = std::vector<TaskId>;

class TaskContext;

// Body of a task. Returns the task's exit status; 0 means success.
using Runnable = std::function<int(TaskContext&)>;

// Outcome of one task invocation.
struct ExecutionResult {
  TaskId task_id;
  int exit_code = 0;
  std::int64_t elapsed_ms = 0;

  bool Succeeded() const {
    return exit_code == 0;
  }
};

} // namespace taskrun::tasks
