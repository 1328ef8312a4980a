#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "app/app_setup.hpp"
#include "pkgdriver/core/config_reader.hpp"
#include "pkgdriver/core/driver_session.hpp"

using pkgdriver::ConfigReader;
using pkgdriver::DriverSession;
using pkgdriver::QueryMode;

namespace {

constexpr int kExitUsage = 1;
constexpr int kExitLoadFailure = 2;

}  // namespace

auto main(int argc, char* argv[]) -> int {
  // Loggers write to stderr so stdout carries only the response
  auto loggers = app::SetupLoggers();

  const std::vector<std::string> args(argv, argv + argc);
  auto command_line = app::ParseCommandLine(args);
  if (!command_line) {
    loggers["pkgdriver"]->error(
        "Usage: pkgdriver [--workspace=<dir>] [--config=<file>] [--match] "
        "<root>...");
    return kExitUsage;
  }

  const std::filesystem::path workspace_root =
      std::filesystem::absolute(command_line->workspace);
  ConfigReader config_reader(loggers["config"]);
  auto config = command_line->config_path
                    ? config_reader.LoadFromFile(*command_line->config_path)
                    : config_reader.LoadFromWorkspace(workspace_root);

  DriverSession session(workspace_root, std::move(config), loggers["pkgdriver"]);
  if (auto loaded = session.Load(); !loaded) {
    loggers["pkgdriver"]->error(
        "Failed to load packages: {}", loaded.error().message());
    return kExitLoadFailure;
  }

  auto result = session.Run(
      command_line->roots,
      command_line->match_labels ? QueryMode::kMatch : QueryMode::kQuery);

  std::cout << nlohmann::json(result).dump() << '\n';
  return 0;
}
