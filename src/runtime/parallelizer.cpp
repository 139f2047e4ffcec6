#include "runtime/parallelizer.hpp"

#include "core/errors/exit_codes.hpp"

#include <system_error>
#include <thread>

namespace taskrun::runtime {

const char* ToString(AggregateOutcome outcome) {
  switch (outcome) {
  case AggregateOutcome::kAllSucceeded:
    return "all_succeeded";
  case AggregateOutcome::kPartialFailure:
    return "partial_failure";
  case AggregateOutcome::kAllFailed:
    return "all_failed";
  case AggregateOutcome::kMissingTask:
    return "missing_task";
  }

  return "all_succeeded";
}

AggregateOutcome ClassifyParallelOutcome(std::size_t failure_count, std::size_t total) {
  if (failure_count == 0U) {
    return AggregateOutcome::kAllSucceeded;
  }
  if (failure_count < total) {
    return AggregateOutcome::kPartialFailure;
  }
  return AggregateOutcome::kAllFailed;
}

int ParallelResult::ExitCode() const {
  using core::errors::ExitCode;
  using core::errors::ToInt;

  switch (outcome) {
  case AggregateOutcome::kAllSucceeded:
    return ToInt(ExitCode::kSuccess);
  case AggregateOutcome::kPartialFailure:
    return ToInt(ExitCode::kParallelPartialFailure);
  case AggregateOutcome::kAllFailed:
    return ToInt(ExitCode::kParallelAllFailed);
  case AggregateOutcome::kMissingTask:
    return ToInt(ExitCode::kFailure);
  }

  return ToInt(ExitCode::kFailure);
}

Parallelizer::Parallelizer(const tasks::TaskRegistry& registry, core::logging::Logger& logger,
                           const Invoker& invoker)
    : registry_(registry), logger_(logger), invoker_(invoker) {}

tasks::ExecutionResult Parallelizer::RunOne(const tasks::TaskId& id,
                                            const tasks::Flags& flags) const {
  tasks::ExecutionResult result;
  std::string error;
  if (!invoker_.Run(id, flags, result, error)) {
    // Ids were verified before launch; a miss here still counts as a failure.
    result.task_id = id;
    result.exit_code = core::errors::ToInt(core::errors::ExitCode::kFailure);
  }
  return result;
}

ParallelResult Parallelizer::Run(const tasks::TaskList& ids, const tasks::Flags& flags) const {
  ParallelResult batch;

  if (!registry_.IsDefinedVerbose(ids, logger_, batch.error)) {
    batch.outcome = AggregateOutcome::kMissingTask;
    return batch;
  }

  logger_.Debug("parallel batch started", {{"tasks", std::to_string(ids.size())}});

  // Each worker owns exactly one slot, so no locking is needed on results.
  batch.results.resize(ids.size());
  std::vector<std::thread> workers;
  workers.reserve(ids.size());
  for (std::size_t i = 0; i < ids.size(); ++i) {
    try {
      workers.emplace_back([this, &batch, &ids, &flags, i]() {
        batch.results[i] = RunOne(ids[i], flags);
      });
    } catch (const std::system_error& ex) {
      logger_.Warn("could not start a thread; running task on the caller thread",
                   {{"task", ids[i]}, {"error", ex.what()}});
      batch.results[i] = RunOne(ids[i], flags);
    }
  }

  for (auto& worker : workers) {
    worker.join();
  }

  for (const auto& result : batch.results) {
    if (!result.Succeeded()) {
      ++batch.failure_count;
    }
  }

  batch.outcome = ClassifyParallelOutcome(batch.failure_count, ids.size());
  if (batch.failure_count > 0U) {
    batch.error = std::to_string(batch.failure_count) + " of " + std::to_string(ids.size()) +
                  " parallel tasks failed";
    logger_.Error(batch.error + " (" + ToString(batch.outcome) + ")");
  }
  return batch;
}

} // namespace taskrun::runtime
