#pragma once

#include "core/logging/logger.hpp"
#include "core/time_utils.hpp"
#include "tasks/registry.hpp"
#include "tasks/task.hpp"
#include "tasks/task_context.hpp"

#include <string>

namespace taskrun::runtime {

// Runs a single named task and measures it.
//
// A non-zero task status is reported as data in `ExecutionResult`, never as
// a failure of the invocation itself. The only failure is an unknown task id,
// in which case nothing runs.
class Invoker {
public:
  Invoker(const tasks::TaskRegistry& registry,
          core::logging::Logger& logger,
          tasks::ITaskHost& host,
          core::MillisClock clock = core::SteadyNowMillis);

  // Contract:
  // - true: the task ran; `result` holds its exit status and elapsed time.
  // - false: `id` is not registered; `error` explains and `result` is reset.
  //
  // Logs "Starting" before the body runs and "Finished" or "failed" after.
  // A body that throws is reported as exit status 1.
  bool Run(const tasks::TaskId& id,
           const tasks::Flags& flags,
           tasks::ExecutionResult& result,
           std::string& error) const;

private:
  const tasks::TaskRegistry& registry_;
  core::logging::Logger& logger_;
  tasks::ITaskHost& host_;
  core::MillisClock clock_;
};

} // namespace taskrun::runtime
