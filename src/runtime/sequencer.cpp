#include "runtime/sequencer.hpp"

#include "core/errors/exit_codes.hpp"

namespace taskrun::runtime {

const char* ToString(SequenceStatus status) {
  switch (status) {
  case SequenceStatus::kSucceeded:
    return "succeeded";
  case SequenceStatus::kMissingTask:
    return "missing_task";
  case SequenceStatus::kTaskFailed:
    return "task_failed";
  }

  return "succeeded";
}

int SequenceResult::ExitCode() const {
  switch (status) {
  case SequenceStatus::kSucceeded:
    return core::errors::ToInt(core::errors::ExitCode::kSuccess);
  case SequenceStatus::kMissingTask:
    return core::errors::ToInt(core::errors::ExitCode::kFailure);
  case SequenceStatus::kTaskFailed:
    if (!results.empty() && results.back().exit_code != 0) {
      return results.back().exit_code;
    }
    return core::errors::ToInt(core::errors::ExitCode::kFailure);
  }

  return core::errors::ToInt(core::errors::ExitCode::kFailure);
}

Sequencer::Sequencer(const tasks::TaskRegistry& registry, core::logging::Logger& logger,
                     const Invoker& invoker)
    : registry_(registry), logger_(logger), invoker_(invoker) {}

SequenceResult Sequencer::Run(const tasks::TaskList& ids, const tasks::Flags& flags) const {
  SequenceResult sequence;

  if (!registry_.IsDefinedVerbose(ids, logger_, sequence.error)) {
    sequence.status = SequenceStatus::kMissingTask;
    return sequence;
  }

  logger_.Debug("sequence started", {{"tasks", std::to_string(ids.size())}});

  for (const auto& id : ids) {
    tasks::ExecutionResult result;
    std::string error;
    if (!invoker_.Run(id, flags, result, error)) {
      sequence.status = SequenceStatus::kMissingTask;
      sequence.failed_task = id;
      sequence.error = error;
      return sequence;
    }

    sequence.results.push_back(result);
    if (!result.Succeeded()) {
      sequence.status = SequenceStatus::kTaskFailed;
      sequence.failed_task = id;
      sequence.error = "task '" + id + "' exited with status " + std::to_string(result.exit_code);
      return sequence;
    }
  }

  return sequence;
}

} // namespace taskrun::runtime
