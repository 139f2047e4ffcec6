#include "runtime/bootstrapper.hpp"

#include "core/errors/exit_codes.hpp"

#include <string>

namespace taskrun::runtime {

const char* ToString(BootstrapState state) {
  switch (state) {
  case BootstrapState::kIdle:
    return "idle";
  case BootstrapState::kResolving:
    return "resolving";
  case BootstrapState::kRunning:
    return "running";
  case BootstrapState::kDone:
    return "done";
  }

  return "idle";
}

Bootstrapper::Bootstrapper(Engine& engine) : engine_(engine) {}

int Bootstrapper::Run(const BootstrapPlan& plan) {
  BootstrapState expected = BootstrapState::kIdle;
  if (!state_.compare_exchange_strong(expected, BootstrapState::kResolving)) {
    engine_.Log().Debug("bootstrap already triggered; ignoring",
                        {{"state", ToString(expected)},
                         {"exit_code", std::to_string(exit_code_.load())}});
    return exit_code_.load();
  }

  return Finish(Resolve(plan));
}

int Bootstrapper::Resolve(const BootstrapPlan& plan) {
  core::logging::Logger& logger = engine_.Log();

  if (!plan.tasks.empty()) {
    state_.store(BootstrapState::kRunning);
    return engine_.RunSequence(plan.tasks, plan.flags).ExitCode();
  }

  if (engine_.Registry().AreDefined({plan.default_task})) {
    state_.store(BootstrapState::kRunning);
    tasks::ExecutionResult result;
    std::string error;
    if (!engine_.RunTask(plan.default_task, plan.flags, result, error)) {
      return core::errors::ToInt(core::errors::ExitCode::kFailure);
    }
    return result.exit_code;
  }

  logger.Info("Nothing to run.");
  engine_.Registry().ShowDefinedTasks(logger);
  return core::errors::ToInt(core::errors::ExitCode::kSuccess);
}

int Bootstrapper::Finish(int status) {
  const int exit_code = core::errors::ToProcessExitCode(status);
  if (exit_code != status) {
    engine_.Log().Debug("task status mapped to process exit code",
                        {{"status", std::to_string(status)},
                         {"exit_code", std::to_string(exit_code)}});
  }
  exit_code_.store(exit_code);
  state_.store(BootstrapState::kDone);
  return exit_code;
}

} // namespace taskrun::runtime
