#pragma once

namespace taskrun::core::errors {

// Stable process-exit contract for scripts and CI wrappers.
//
// The first three values keep their conventional meanings:
// - 0 success (including "nothing to run")
// - 1 generic failure, also used when a requested task is not defined
// - 2 invalid runner configuration
//
// 41 and 42 classify a parallel batch so wrappers can tell "some parallel work
// failed" from "everything failed" without scraping output. A task that fails
// inside a sequence propagates its own exit status instead.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kParallelPartialFailure = 41,
  kParallelAllFailed = 42,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

// The OS keeps only the low 8 bits of a process exit status. Task statuses are
// plain ints, so a failing status must not truncate to 0 (256, -256, ...).
// Non-zero statuses keep their low byte when that byte is non-zero and fall
// back to the generic failure code otherwise.
constexpr int ToProcessExitCode(int status) {
  if (status == 0) {
    return ToInt(ExitCode::kSuccess);
  }
  const int low_byte = status & 0xFF;
  if (low_byte == 0) {
    return ToInt(ExitCode::kFailure);
  }
  return low_byte;
}

} // namespace taskrun::core::errors
