#pragma once

#include "core/logging/logger.hpp"
#include "tasks/task.hpp"

#include <map>
#include <string>

namespace taskrun::tasks {

// Explicit name -> runnable table, populated once at startup before the
// bootstrapper runs and only read afterwards.
//
// Iteration order is lexicographic so listings are identical on every call.
class TaskRegistry {
public:
  // Adds one task.
  //
  // Contract:
  // - true: `id` is now bound to `runnable`.
  // - false: `id` is empty, contains whitespace, starts with '-' (it could
  //   never be selected from the command line), is already registered, or
  //   `runnable` is empty; `error` explains which.
  bool Register(const TaskId& id, Runnable runnable, std::string& error);

  TaskList ListTasks() const;

  bool IsDefined(const TaskId& id) const;

  // Silent check of every id, stopping at the first missing one.
  bool AreDefined(const TaskList& ids) const;

  // Like AreDefined, but logs `Task '<id>' is not defined!` for the first
  // missing id and reports it through `error`. Later ids are not inspected.
  bool IsDefinedVerbose(const TaskList& ids, core::logging::Logger& logger,
                        std::string& error) const;

  // Returns nullptr when `id` is not registered.
  const Runnable* Find(const TaskId& id) const;

  // Prints "Available tasks:" followed by one indented line per task.
  void ShowDefinedTasks(core::logging::Logger& logger) const;

  std::size_t Size() const {
    return tasks_.size();
  }

  bool Empty() const {
    return tasks_.empty();
  }

private:
  std::map<TaskId, Runnable> tasks_;
};

} // namespace taskrun::tasks
