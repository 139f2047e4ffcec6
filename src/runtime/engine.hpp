#pragma once

#include "core/logging/logger.hpp"
#include "core/time_utils.hpp"
#include "runtime/invoker.hpp"
#include "runtime/parallelizer.hpp"
#include "runtime/sequencer.hpp"
#include "tasks/registry.hpp"
#include "tasks/task_context.hpp"

#include <string>

namespace taskrun::runtime {

// Wires invoker, sequencer and parallelizer over one registry and logger.
//
// The engine is also the host that task bodies call back into, so a task can
// run its own sequences or parallel batches with the same primitives the
// bootstrapper uses.
class Engine final : public tasks::ITaskHost {
public:
  Engine(const tasks::TaskRegistry& registry,
         core::logging::Logger& logger,
         core::MillisClock clock = core::SteadyNowMillis);

  Engine(const Engine&) = delete;
  Engine& operator=(const Engine&) = delete;

  bool RunTask(const tasks::TaskId& id,
               const tasks::Flags& flags,
               tasks::ExecutionResult& result,
               std::string& error) const;

  SequenceResult RunSequence(const tasks::TaskList& ids, const tasks::Flags& flags) const;

  ParallelResult RunParallel(const tasks::TaskList& ids, const tasks::Flags& flags) const;

  const tasks::TaskRegistry& Registry() const {
    return registry_;
  }

  // tasks::ITaskHost
  int Sequence(const tasks::TaskList& ids, const tasks::Flags& flags) override;
  int Parallel(const tasks::TaskList& ids, const tasks::Flags& flags) override;
  core::logging::Logger& Log() override;

private:
  const tasks::TaskRegistry& registry_;
  core::logging::Logger& logger_;
  Invoker invoker_;
  Sequencer sequencer_;
  Parallelizer parallelizer_;
};

} // namespace taskrun::runtime
