#pragma once

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <spdlog/logger.h>

namespace app {

struct CommandLine {
  std::string workspace;
  std::optional<std::string> config_path;
  bool match_labels = false;
  std::vector<std::string> roots;
};

/// Parse command line arguments:
///   [--workspace=<dir>] [--config=<file>] [--match] <root>...
/// Returns nullopt on an unknown flag or when no root is given
auto ParseCommandLine(const std::vector<std::string>& args)
    -> std::optional<CommandLine>;

/// Setup named loggers writing to stderr; stdout carries the JSON response
auto SetupLoggers()
    -> std::unordered_map<std::string, std::shared_ptr<spdlog::logger>>;

}  // namespace app
