#pragma once

#include "core/logging/logger.hpp"
#include "runtime/invoker.hpp"
#include "tasks/registry.hpp"
#include "tasks/task.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace taskrun::runtime {

// Classification of a parallel batch by failure count.
enum class AggregateOutcome {
  kAllSucceeded,
  kPartialFailure,
  kAllFailed,
  // Rejected before launch because an id is not registered.
  kMissingTask,
};

const char* ToString(AggregateOutcome outcome);

// 0 failures -> all succeeded, every task failed -> all failed, anything in
// between -> partial failure. An empty batch counts as all succeeded.
AggregateOutcome ClassifyParallelOutcome(std::size_t failure_count, std::size_t total);

struct ParallelResult {
  AggregateOutcome outcome = AggregateOutcome::kAllSucceeded;
  // One entry per requested id, in list order regardless of completion order.
  std::vector<tasks::ExecutionResult> results;
  std::size_t failure_count = 0;
  std::string error;

  bool Succeeded() const {
    return outcome == AggregateOutcome::kAllSucceeded;
  }

  int ExitCode() const;
};

// Concurrent fan-out/fan-in over the invoker.
//
// Each task runs on its own thread. The join waits for every task even after
// one has failed; siblings are never cancelled. The only data shared between
// the threads is the read-only flag list and the registry.
class Parallelizer {
public:
  Parallelizer(const tasks::TaskRegistry& registry, core::logging::Logger& logger,
               const Invoker& invoker);

  ParallelResult Run(const tasks::TaskList& ids, const tasks::Flags& flags) const;

private:
  tasks::ExecutionResult RunOne(const tasks::TaskId& id, const tasks::Flags& flags) const;

  const tasks::TaskRegistry& registry_;
  core::logging::Logger& logger_;
  const Invoker& invoker_;
};

} // namespace taskrun::runtime
