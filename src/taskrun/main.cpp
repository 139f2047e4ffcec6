#include "core/errors/exit_codes.hpp"
#include "taskrun/cli/router.hpp"
#include "taskrun/example_tasks.hpp"

#include <iostream>
#include <string>

int main(int argc, char** argv) {
  // Task setup must succeed before anything is bootstrapped; the CLI router
  // owns argument handling and the exit-code contract.
  taskrun::tasks::TaskRegistry registry;
  std::string error;
  if (!taskrun::RegisterExampleTasks(registry, error)) {
    std::cerr << "error: " << error << '\n';
    return taskrun::core::errors::ToInt(taskrun::core::errors::ExitCode::kFailure);
  }

  return taskrun::cli::Dispatch(argc, argv, registry, taskrun::kExampleDefaultTask);
}
