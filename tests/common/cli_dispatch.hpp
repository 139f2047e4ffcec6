#ifndef TASKRUN_TESTS_COMMON_CLI_DISPATCH_HPP_
#define TASKRUN_TESTS_COMMON_CLI_DISPATCH_HPP_

#include "taskrun/cli/router.hpp"

#include <map>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace taskrun::tests::common {

// Fixed environment for dispatch tests so the host's TASKRUN_* and NO_COLOR
// settings never leak into assertions.
class FakeEnvironment {
public:
  FakeEnvironment() = default;
  explicit FakeEnvironment(std::map<std::string, std::string> values) : values_(std::move(values)) {}

  cli::EnvironmentLookup Lookup() const {
    return [this](const char* name) -> const char* {
      const auto it = values_.find(name);
      if (it == values_.end()) {
        return nullptr;
      }
      return it->second.c_str();
    };
  }

private:
  std::map<std::string, std::string> values_;
};

// Runs the router with argv built from `argv_storage` (program name first)
// and captures everything the runner printed.
inline int DispatchArgs(const std::vector<std::string>& argv_storage,
                        const tasks::TaskRegistry& registry,
                        const tasks::TaskId& default_task,
                        const FakeEnvironment& environment,
                        std::string& output) {
  std::vector<char*> argv;
  argv.reserve(argv_storage.size());
  for (const auto& arg : argv_storage) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }

  std::ostringstream captured;
  const int exit_code = cli::Dispatch(static_cast<int>(argv.size()), argv.data(), registry,
                                      default_task, environment.Lookup(), captured);
  output = captured.str();
  return exit_code;
}

} // namespace taskrun::tests::common

#endif // TASKRUN_TESTS_COMMON_CLI_DISPATCH_HPP_
