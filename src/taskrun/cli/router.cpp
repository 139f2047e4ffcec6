#include "taskrun/cli/router.hpp"

#include "core/errors/exit_codes.hpp"
#include "runtime/engine.hpp"

#include <cstdlib>

namespace taskrun::cli {

namespace {

constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);

std::string JoinForLog(const std::vector<std::string>& values) {
  std::string joined;
  for (const auto& value : values) {
    if (!joined.empty()) {
      joined += ' ';
    }
    joined += value;
  }
  return joined;
}

} // namespace

const char* ProcessEnvironment(const char* name) {
  return std::getenv(name);
}

void ParseCommandLine(const std::vector<std::string_view>& args, RunnerConfig& config) {
  for (const std::string_view token : args) {
    if (token.empty()) {
      continue;
    }
    if (token.front() == '-') {
      config.plan.flags.emplace_back(token);
      continue;
    }
    config.plan.tasks.emplace_back(token);
  }
}

bool ApplyEnvironment(const EnvironmentLookup& lookup, RunnerConfig& config, std::string& error) {
  error.clear();

  if (const char* raw = lookup("TASKRUN_LOG_LEVEL"); raw != nullptr && *raw != '\0') {
    core::logging::LogLevel parsed = core::logging::LogLevel::kInfo;
    if (!core::logging::ParseLogLevel(raw, parsed, error)) {
      return false;
    }
    config.log_level = parsed;
  }

  if (const char* raw = lookup("TASKRUN_COLOR"); raw != nullptr && *raw != '\0') {
    core::logging::ColorMode parsed = core::logging::ColorMode::kAuto;
    if (!core::logging::ParseColorMode(raw, parsed, error)) {
      return false;
    }
    config.color_mode = parsed;
  }

  config.no_color = lookup("NO_COLOR") != nullptr;
  return true;
}

int Dispatch(int argc, char** argv, const tasks::TaskRegistry& registry,
             const tasks::TaskId& default_task) {
  return Dispatch(argc, argv, registry, default_task, ProcessEnvironment, std::cout);
}

int Dispatch(int argc, char** argv, const tasks::TaskRegistry& registry,
             const tasks::TaskId& default_task, const EnvironmentLookup& lookup,
             std::ostream& out) {
  RunnerConfig config;
  config.plan.default_task = default_task;

  std::vector<std::string_view> args;
  if (argc > 1) {
    args.assign(argv + 1, argv + argc);
  }
  ParseCommandLine(args, config);

  std::string error;
  if (!ApplyEnvironment(lookup, config, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  core::logging::Logger logger(config.log_level, out);
  logger.SetColorEnabled(
      core::logging::ResolveColorEnabled(config.color_mode, out, config.no_color));
  logger.Debug("bootstrap requested",
               {{"tasks", JoinForLog(config.plan.tasks)},
                {"flags", JoinForLog(config.plan.flags)},
                {"default_task", config.plan.default_task},
                {"color", core::logging::ToString(config.color_mode)}});

  runtime::Engine engine(registry, logger);
  runtime::Bootstrapper bootstrapper(engine);
  const int exit_code = bootstrapper.Run(config.plan);
  logger.Debug("bootstrap finished", {{"exit_code", std::to_string(exit_code)}});
  return exit_code;
}

} // namespace taskrun::cli
