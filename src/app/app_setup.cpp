#include "app/app_setup.hpp"

#include <array>
#include <cstdlib>
#include <string_view>
#include <unordered_map>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace app {

namespace {

constexpr std::string_view kDefaultLogLevel = "info";
constexpr std::string_view kLogPattern = "[%n][%L] %v";

auto ParseLogLevel(std::string_view level_str) -> spdlog::level::level_enum {
  static const std::unordered_map<std::string_view, spdlog::level::level_enum>
      kLevelMap = {
          {"trace", spdlog::level::trace}, {"debug", spdlog::level::debug},
          {"info", spdlog::level::info},   {"warn", spdlog::level::warn},
          {"error", spdlog::level::err},   {"off", spdlog::level::off},
      };

  if (auto it = kLevelMap.find(level_str); it != kLevelMap.end()) {
    return it->second;
  }
  return spdlog::level::info;
}

auto GetLogLevelFromEnv() -> spdlog::level::level_enum {
  const char* env_level = std::getenv("SPDLOG_LEVEL");
  return ParseLogLevel(env_level != nullptr ? env_level : kDefaultLogLevel);
}

// Value of `--name=value`, or nullopt when `arg` is a different flag
auto FlagValue(std::string_view arg, std::string_view prefix)
    -> std::optional<std::string> {
  if (!arg.starts_with(prefix)) {
    return std::nullopt;
  }
  return std::string(arg.substr(prefix.length()));
}

}  // namespace

auto ParseCommandLine(const std::vector<std::string>& args)
    -> std::optional<CommandLine> {
  constexpr std::string_view kWorkspacePrefix = "--workspace=";
  constexpr std::string_view kConfigPrefix = "--config=";
  constexpr std::string_view kMatchFlag = "--match";

  CommandLine command_line;
  command_line.workspace = ".";

  // args[0] is the executable
  for (size_t i = 1; i < args.size(); ++i) {
    const auto& arg = args[i];
    if (auto workspace = FlagValue(arg, kWorkspacePrefix)) {
      command_line.workspace = *workspace;
    } else if (auto config = FlagValue(arg, kConfigPrefix)) {
      command_line.config_path = *config;
    } else if (arg == kMatchFlag) {
      command_line.match_labels = true;
    } else if (arg.starts_with("--")) {
      return std::nullopt;
    } else {
      command_line.roots.push_back(arg);
    }
  }

  if (command_line.roots.empty() || command_line.workspace.empty()) {
    return std::nullopt;
  }
  return command_line;
}

auto SetupLoggers()
    -> std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> {
  const auto user_log_level = GetLogLevelFromEnv();
  spdlog::set_level(user_log_level);

  constexpr std::array kLoggerNames = {"pkgdriver", "config"};

  std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> loggers;
  for (const auto* name : kLoggerNames) {
    auto logger = spdlog::stderr_color_mt(name);
    logger->set_pattern(std::string(kLogPattern));
    logger->set_level(user_log_level);
    loggers[name] = std::move(logger);
  }

  return loggers;
}

}  // namespace app
