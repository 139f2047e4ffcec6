#include "tasks/registry.hpp"

#include "core/logging/color.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace taskrun::tasks {

namespace {

bool ValidateTaskId(const TaskId& id, std::string& error) {
  if (id.empty()) {
    error = "task id cannot be empty";
    return false;
  }
  if (id.front() == '-') {
    error = "task id cannot start with '-': " + id;
    return false;
  }
  const bool has_space = std::any_of(id.begin(), id.end(), [](unsigned char c) {
    return std::isspace(c) != 0;
  });
  if (has_space) {
    error = "task id cannot contain whitespace: '" + id + "'";
    return false;
  }
  return true;
}

} // namespace

bool TaskRegistry::Register(const TaskId& id, Runnable runnable, std::string& error) {
  error.clear();

  if (!ValidateTaskId(id, error)) {
    return false;
  }
  if (!runnable) {
    error = "task '" + id + "' has no body";
    return false;
  }
  if (tasks_.find(id) != tasks_.end()) {
    error = "task '" + id + "' is already registered";
    return false;
  }

  tasks_.emplace(id, std::move(runnable));
  return true;
}

TaskList TaskRegistry::ListTasks() const {
  TaskList ids;
  ids.reserve(tasks_.size());
  for (const auto& [id, runnable] : tasks_) {
    ids.push_back(id);
  }
  return ids;
}

bool TaskRegistry::IsDefined(const TaskId& id) const {
  return tasks_.find(id) != tasks_.end();
}

bool TaskRegistry::AreDefined(const TaskList& ids) const {
  return std::all_of(ids.begin(), ids.end(), [this](const TaskId& id) { return IsDefined(id); });
}

bool TaskRegistry::IsDefinedVerbose(const TaskList& ids, core::logging::Logger& logger,
                                    std::string& error) const {
  error.clear();
  for (const auto& id : ids) {
    if (!IsDefined(id)) {
      logger.Error("Task '" + id + "' is not defined!");
      error = "task '" + id + "' is not defined";
      return false;
    }
  }
  return true;
}

const Runnable* TaskRegistry::Find(const TaskId& id) const {
  const auto it = tasks_.find(id);
  if (it == tasks_.end()) {
    return nullptr;
  }
  return &it->second;
}

void TaskRegistry::ShowDefinedTasks(core::logging::Logger& logger) const {
  using core::logging::Color;

  logger.Info("Available tasks:");
  if (tasks_.empty()) {
    logger.Info("  " + logger.Paint(Color::kLightGray, "<none>"));
    return;
  }
  for (const auto& [id, runnable] : tasks_) {
    logger.Info("  " + logger.Paint(Color::kCyan, id));
  }
}

} // namespace taskrun::tasks
