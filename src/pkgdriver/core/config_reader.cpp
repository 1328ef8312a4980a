#include "pkgdriver/core/config_reader.hpp"

namespace pkgdriver {

ConfigReader::ConfigReader(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? logger : spdlog::default_logger()) {
}

auto ConfigReader::LoadFromFile(const std::filesystem::path& config_path) const
    -> DriverConfigFile {
  logger_->debug("ConfigReader loading config from: {}", config_path.string());

  if (auto config = DriverConfigFile::LoadFromFile(config_path, logger_)) {
    return *std::move(config);
  }
  logger_->info("ConfigReader using default configuration");
  return DriverConfigFile::CreateDefault(logger_);
}

auto ConfigReader::LoadFromWorkspace(
    const std::filesystem::path& workspace_root) const -> DriverConfigFile {
  logger_->debug(
      "ConfigReader loading config from workspace: {}",
      workspace_root.string());
  return LoadFromFile(workspace_root / kConfigFileName);
}

}  // namespace pkgdriver
