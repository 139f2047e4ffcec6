#pragma once

#include "core/logging/logger.hpp"
#include "tasks/task.hpp"

#include <string_view>

namespace taskrun::tasks {

// Execution services a running task may call back into. Implemented by the
// runtime engine; kept abstract here so task code does not depend on it.
class ITaskHost {
public:
  virtual ~ITaskHost() = default;

  // Runs `ids` one after another, stopping at the first failure. Returns the
  // process-style exit code of the sequence.
  virtual int Sequence(const TaskList& ids, const Flags& flags) = 0;

  // Runs `ids` concurrently and waits for all of them. Returns 0, the
  // partial-failure code or the all-failed code.
  virtual int Parallel(const TaskList& ids, const Flags& flags) = 0;

  virtual core::logging::Logger& Log() = 0;
};

// Handle passed to a task body for the duration of one invocation.
class TaskContext {
public:
  TaskContext(ITaskHost& host, TaskId task_id, const Flags& flags);

  const TaskId& Id() const {
    return task_id_;
  }

  const Flags& ForwardedFlags() const {
    return *flags_;
  }

  bool HasFlag(std::string_view flag) const;

  // Nested composition. Both forward this task's flags unchanged.
  int Sequence(const TaskList& ids);
  int Parallel(const TaskList& ids);

  core::logging::Logger& Log() {
    return host_->Log();
  }

private:
  ITaskHost* host_;
  TaskId task_id_;
  const Flags* flags_;
};

} // namespace taskrun::tasks
