#include "taskrun/example_tasks.hpp"

#include "tasks/shell_task.hpp"
#include "tasks/task_context.hpp"

#include <chrono>
#include <thread>
#include <utility>
#include <vector>

namespace taskrun {

namespace {

// Simulated unit of work: sleeps for `work`, then fails if `fail_flag` was
// forwarded from the command line.
tasks::Runnable MakeTimedStep(std::string message, std::chrono::milliseconds work,
                              std::string fail_flag) {
  return [message = std::move(message), work, fail_flag = std::move(fail_flag)](
             tasks::TaskContext& context) -> int {
    context.Log().Info(message);
    std::this_thread::sleep_for(work);
    if (context.HasFlag(fail_flag)) {
      context.Log().Warn("failure requested by " + fail_flag);
      return 1;
    }
    return 0;
  };
}

} // namespace

bool RegisterExampleTasks(tasks::TaskRegistry& registry, std::string& error) {
  using std::chrono::milliseconds;

  std::vector<std::pair<tasks::TaskId, tasks::Runnable>> definitions;
  definitions.emplace_back("clean", tasks::MakeShellTask("echo removing build outputs"));
  definitions.emplace_back(
      "build", MakeTimedStep("compiling sources", milliseconds(300), "--fail-build"));
  definitions.emplace_back("lint",
                           MakeTimedStep("checking style", milliseconds(200), "--fail-lint"));
  definitions.emplace_back("test",
                           MakeTimedStep("running unit tests", milliseconds(400), "--fail-test"));
  definitions.emplace_back("check", [](tasks::TaskContext& context) {
    return context.Parallel({"lint", "test"});
  });
  definitions.emplace_back("ci", [](tasks::TaskContext& context) {
    return context.Sequence({"clean", "build", "check"});
  });
  definitions.emplace_back(kExampleDefaultTask, [](tasks::TaskContext& context) {
    return context.Sequence({"ci"});
  });

  for (auto& [id, runnable] : definitions) {
    if (!registry.Register(id, std::move(runnable), error)) {
      return false;
    }
  }
  return true;
}

} // namespace taskrun
