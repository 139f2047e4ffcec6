#include "runtime/engine.hpp"

#include <utility>

namespace taskrun::runtime {

Engine::Engine(const tasks::TaskRegistry& registry,
               core::logging::Logger& logger,
               core::MillisClock clock)
    : registry_(registry),
      logger_(logger),
      invoker_(registry, logger, *this, std::move(clock)),
      sequencer_(registry, logger, invoker_),
      parallelizer_(registry, logger, invoker_) {}

bool Engine::RunTask(const tasks::TaskId& id,
                     const tasks::Flags& flags,
                     tasks::ExecutionResult& result,
                     std::string& error) const {
  return invoker_.Run(id, flags, result, error);
}

SequenceResult Engine::RunSequence(const tasks::TaskList& ids, const tasks::Flags& flags) const {
  return sequencer_.Run(ids, flags);
}

ParallelResult Engine::RunParallel(const tasks::TaskList& ids, const tasks::Flags& flags) const {
  return parallelizer_.Run(ids, flags);
}

int Engine::Sequence(const tasks::TaskList& ids, const tasks::Flags& flags) {
  const SequenceResult result = RunSequence(ids, flags);
  logger_.Debug("nested sequence finished",
                {{"status", ToString(result.status)},
                 {"exit_code", std::to_string(result.ExitCode())}});
  return result.ExitCode();
}

int Engine::Parallel(const tasks::TaskList& ids, const tasks::Flags& flags) {
  return RunParallel(ids, flags).ExitCode();
}

core::logging::Logger& Engine::Log() {
  return logger_;
}

} // namespace taskrun::runtime
