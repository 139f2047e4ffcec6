#include "runtime/engine.hpp"
#include "runtime/parallelizer.hpp"

#include "common/task_fixtures.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <sstream>
#include <string>
#include <thread>

namespace {

using taskrun::core::logging::Logger;
using taskrun::core::logging::LogLevel;
using taskrun::runtime::AggregateOutcome;
using taskrun::runtime::ClassifyParallelOutcome;
using taskrun::runtime::Engine;
using taskrun::runtime::ParallelResult;
using taskrun::tasks::TaskContext;
using taskrun::tasks::TaskRegistry;
using taskrun::tests::common::CallRecorder;
using taskrun::tests::common::MakeRecordingTask;
using taskrun::tests::common::RegisterOrFail;

struct ParallelFixture {
  ParallelFixture() : logger(LogLevel::kInfo, out), engine(registry, logger) {}

  CallRecorder recorder;
  TaskRegistry registry;
  std::ostringstream out;
  Logger logger;
  Engine engine;
};

} // namespace

TEST_CASE("Outcome classification follows the failure count", "[runtime][parallel]") {
  REQUIRE(ClassifyParallelOutcome(0, 0) == AggregateOutcome::kAllSucceeded);
  REQUIRE(ClassifyParallelOutcome(0, 4) == AggregateOutcome::kAllSucceeded);
  REQUIRE(ClassifyParallelOutcome(1, 4) == AggregateOutcome::kPartialFailure);
  REQUIRE(ClassifyParallelOutcome(3, 4) == AggregateOutcome::kPartialFailure);
  REQUIRE(ClassifyParallelOutcome(4, 4) == AggregateOutcome::kAllFailed);
  REQUIRE(ClassifyParallelOutcome(1, 1) == AggregateOutcome::kAllFailed);
}

TEST_CASE("All succeeding tasks yield success", "[runtime][parallel]") {
  ParallelFixture fixture;
  RegisterOrFail(fixture.registry, "a", MakeRecordingTask(fixture.recorder, 0));
  RegisterOrFail(fixture.registry, "b", MakeRecordingTask(fixture.recorder, 0));
  RegisterOrFail(fixture.registry, "c", MakeRecordingTask(fixture.recorder, 0));

  const ParallelResult result = fixture.engine.RunParallel({"a", "b", "c"}, {});
  REQUIRE(result.Succeeded());
  REQUIRE(result.ExitCode() == 0);
  REQUIRE(result.failure_count == 0U);
  REQUIRE(result.results.size() == 3U);
  REQUIRE(fixture.recorder.Calls().size() == 3U);
}

TEST_CASE("Some failing tasks yield partial failure", "[runtime][parallel]") {
  ParallelFixture fixture;
  RegisterOrFail(fixture.registry, "a", MakeRecordingTask(fixture.recorder, 0));
  RegisterOrFail(fixture.registry, "b", MakeRecordingTask(fixture.recorder, 1));

  const ParallelResult result = fixture.engine.RunParallel({"a", "b"}, {});
  REQUIRE(result.outcome == AggregateOutcome::kPartialFailure);
  REQUIRE(result.ExitCode() == 41);
  REQUIRE(result.failure_count == 1U);
  REQUIRE(fixture.recorder.Count("a") == 1U);
  REQUIRE(fixture.recorder.Count("b") == 1U);
  REQUIRE(fixture.out.str().find("1 of 2 parallel tasks failed") != std::string::npos);
}

TEST_CASE("Every task failing yields all failed", "[runtime][parallel]") {
  ParallelFixture fixture;
  RegisterOrFail(fixture.registry, "a", MakeRecordingTask(fixture.recorder, 0));
  RegisterOrFail(fixture.registry, "b", MakeRecordingTask(fixture.recorder, 1));
  RegisterOrFail(fixture.registry, "c", MakeRecordingTask(fixture.recorder, 1));

  // `a` succeeds, so a,b,c is partial; b,c alone is a total failure.
  const ParallelResult mixed = fixture.engine.RunParallel({"a", "b", "c"}, {});
  REQUIRE(mixed.outcome == AggregateOutcome::kPartialFailure);
  REQUIRE(mixed.ExitCode() == 41);

  const ParallelResult failed = fixture.engine.RunParallel({"b", "c"}, {});
  REQUIRE(failed.outcome == AggregateOutcome::kAllFailed);
  REQUIRE(failed.ExitCode() == 42);
  REQUIRE(failed.failure_count == 2U);
}

TEST_CASE("A worker throwing a non-standard exception counts as a failure", "[runtime][parallel]") {
  ParallelFixture fixture;
  RegisterOrFail(fixture.registry, "a", MakeRecordingTask(fixture.recorder, 0));
  RegisterOrFail(fixture.registry, "boom", [](TaskContext&) -> int {
    throw std::string("not an exception type");
  });

  const ParallelResult result = fixture.engine.RunParallel({"a", "boom"}, {});
  REQUIRE(result.outcome == AggregateOutcome::kPartialFailure);
  REQUIRE(result.ExitCode() == 41);
  REQUIRE(result.results.size() == 2U);
  REQUIRE(result.results[1].exit_code == 1);
  REQUIRE(fixture.recorder.Count("a") == 1U);
}

TEST_CASE("Results keep list order whatever the completion order", "[runtime][parallel]") {
  ParallelFixture fixture;
  RegisterOrFail(fixture.registry, "slow", [](TaskContext&) {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    return 2;
  });
  RegisterOrFail(fixture.registry, "fast", MakeRecordingTask(fixture.recorder, 0));

  const ParallelResult result = fixture.engine.RunParallel({"slow", "fast"}, {});
  REQUIRE(result.results.size() == 2U);
  REQUIRE(result.results[0].task_id == "slow");
  REQUIRE(result.results[0].exit_code == 2);
  REQUIRE(result.results[1].task_id == "fast");
  REQUIRE(result.results[1].exit_code == 0);
}

TEST_CASE("Failed siblings do not cancel the rest of the batch", "[runtime][parallel]") {
  ParallelFixture fixture;
  std::atomic<bool> slow_finished{false};
  RegisterOrFail(fixture.registry, "quick_fail", MakeRecordingTask(fixture.recorder, 1));
  RegisterOrFail(fixture.registry, "slow_ok", [&slow_finished](TaskContext&) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    slow_finished.store(true);
    return 0;
  });

  const ParallelResult result = fixture.engine.RunParallel({"quick_fail", "slow_ok"}, {});
  REQUIRE(slow_finished.load());
  REQUIRE(result.outcome == AggregateOutcome::kPartialFailure);
}

TEST_CASE("Batch tasks run concurrently", "[runtime][parallel]") {
  ParallelFixture fixture;
  std::atomic<int> started{0};

  // Each task waits until the other has started; sequential execution would
  // time out and report failure.
  const auto rendezvous = [&started](TaskContext&) {
    started.fetch_add(1);
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (started.load() < 2) {
      if (std::chrono::steady_clock::now() > deadline) {
        return 1;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return 0;
  };
  RegisterOrFail(fixture.registry, "left", rendezvous);
  RegisterOrFail(fixture.registry, "right", rendezvous);

  const ParallelResult result = fixture.engine.RunParallel({"left", "right"}, {});
  REQUIRE(result.Succeeded());
}

TEST_CASE("An undefined id launches nothing", "[runtime][parallel]") {
  ParallelFixture fixture;
  RegisterOrFail(fixture.registry, "a", MakeRecordingTask(fixture.recorder, 0));

  const ParallelResult result = fixture.engine.RunParallel({"a", "nope"}, {});
  REQUIRE(result.outcome == AggregateOutcome::kMissingTask);
  REQUIRE(result.ExitCode() == 1);
  REQUIRE(result.results.empty());
  REQUIRE(fixture.recorder.Calls().empty());
  REQUIRE(result.error == "task 'nope' is not defined");
}

TEST_CASE("Tasks can fan out from inside a sequence", "[runtime][parallel]") {
  ParallelFixture fixture;
  RegisterOrFail(fixture.registry, "lint", MakeRecordingTask(fixture.recorder, 0));
  RegisterOrFail(fixture.registry, "test", MakeRecordingTask(fixture.recorder, 1));
  RegisterOrFail(fixture.registry, "check", [](TaskContext& context) {
    return context.Parallel({"lint", "test"});
  });
  RegisterOrFail(fixture.registry, "after", MakeRecordingTask(fixture.recorder, 0));

  const auto result = fixture.engine.RunSequence({"check", "after"}, {});
  REQUIRE(result.ExitCode() == 41);
  REQUIRE(result.failed_task == "check");
  REQUIRE(fixture.recorder.Count("after") == 0U);
}
