#pragma once

#include "core/logging/logger.hpp"
#include "runtime/invoker.hpp"
#include "tasks/registry.hpp"
#include "tasks/task.hpp"

#include <string>
#include <vector>

namespace taskrun::runtime {

enum class SequenceStatus {
  kSucceeded,
  kMissingTask,
  kTaskFailed,
};

const char* ToString(SequenceStatus status);

struct SequenceResult {
  SequenceStatus status = SequenceStatus::kSucceeded;
  // Results of the tasks that actually ran, in execution order. The failing
  // task, if any, is the last entry.
  std::vector<tasks::ExecutionResult> results;
  tasks::TaskId failed_task;
  std::string error;

  bool Succeeded() const {
    return status == SequenceStatus::kSucceeded;
  }

  // 0 on success, the failing task's own status on task failure, the
  // generic failure code when a task is missing.
  int ExitCode() const;
};

// Strict fail-fast sequential composition.
//
// Every id is checked against the registry before anything runs, so a typo
// anywhere in the list rejects the whole sequence. Completed tasks are never
// rolled back.
class Sequencer {
public:
  Sequencer(const tasks::TaskRegistry& registry, core::logging::Logger& logger,
            const Invoker& invoker);

  SequenceResult Run(const tasks::TaskList& ids, const tasks::Flags& flags) const;

private:
  const tasks::TaskRegistry& registry_;
  core::logging::Logger& logger_;
  const Invoker& invoker_;
};

} // namespace taskrun::runtime
