#include "runtime/invoker.hpp"

#include "core/errors/exit_codes.hpp"

#include <exception>
#include <utility>

namespace taskrun::runtime {

namespace {

using core::logging::Color;

int InvokeBody(const tasks::Runnable& runnable, tasks::TaskContext& context,
               core::logging::Logger& logger) {
  try {
    return runnable(context);
  } catch (const std::exception& ex) {
    logger.Error("Task '" + context.Id() + "' threw an exception: " + ex.what());
    return core::errors::ToInt(core::errors::ExitCode::kFailure);
  } catch (...) {
    // Anything else would escape a worker thread and terminate the process.
    logger.Error("Task '" + context.Id() + "' threw an unknown exception");
    return core::errors::ToInt(core::errors::ExitCode::kFailure);
  }
}

} // namespace

Invoker::Invoker(const tasks::TaskRegistry& registry,
                 core::logging::Logger& logger,
                 tasks::ITaskHost& host,
                 core::MillisClock clock)
    : registry_(registry), logger_(logger), host_(host), clock_(std::move(clock)) {}

bool Invoker::Run(const tasks::TaskId& id,
                  const tasks::Flags& flags,
                  tasks::ExecutionResult& result,
                  std::string& error) const {
  result = tasks::ExecutionResult{};
  result.task_id = id;
  error.clear();

  const tasks::Runnable* runnable = registry_.Find(id);
  if (runnable == nullptr) {
    logger_.Error("Task '" + id + "' is not defined!");
    error = "task '" + id + "' is not defined";
    return false;
  }

  const std::string painted_id = logger_.Paint(Color::kCyan, id);
  logger_.Info("Starting '" + painted_id + "'...");

  tasks::TaskContext context(host_, id, flags);
  const std::int64_t start_ms = clock_();
  result.exit_code = InvokeBody(*runnable, context, logger_);
  const std::int64_t end_ms = clock_();
  result.elapsed_ms = core::ElapsedMillis(start_ms, end_ms);

  const std::string duration = core::FormatDuration(result.elapsed_ms);
  if (!result.Succeeded()) {
    logger_.Error("Task '" + id + "' failed after " + duration + " (" +
                  std::to_string(result.exit_code) + ")");
    return true;
  }

  logger_.Info("Finished '" + painted_id + "' after " + logger_.Paint(Color::kPurple, duration));
  return true;
}

} // namespace taskrun::runtime
