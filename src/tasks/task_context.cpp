#include "tasks/task_context.hpp"

#include <algorithm>
#include <utility>

namespace taskrun::tasks {

TaskContext::TaskContext(ITaskHost& host, TaskId task_id, const Flags& flags)
    : host_(&host), task_id_(std::move(task_id)), flags_(&flags) {}

bool TaskContext::HasFlag(std::string_view flag) const {
  return std::any_of(flags_->begin(), flags_->end(),
                     [flag](const std::string& candidate) { return candidate == flag; });
}

int TaskContext::Sequence(const TaskList& ids) {
  return host_->Sequence(ids, *flags_);
}

int TaskContext::Parallel(const TaskList& ids) {
  return host_->Parallel(ids, *flags_);
}

} // namespace taskrun::tasks
