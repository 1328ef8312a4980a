#pragma once

#include <filesystem>
#include <memory>

#include <spdlog/spdlog.h>

#include "pkgdriver/core/driver_config_file.hpp"

namespace pkgdriver {

inline constexpr const char* kConfigFileName = ".pkgdriver";

// ConfigReader locates and loads the driver configuration. Unlike
// DriverConfigFile::LoadFromFile it always yields a usable configuration.
class ConfigReader {
 public:
  explicit ConfigReader(std::shared_ptr<spdlog::logger> logger = nullptr);

  // Load an explicit config file, falling back to defaults on failure
  [[nodiscard]] auto LoadFromFile(const std::filesystem::path& config_path) const
      -> DriverConfigFile;

  // Load <workspace_root>/.pkgdriver, falling back to defaults
  [[nodiscard]] auto LoadFromWorkspace(
      const std::filesystem::path& workspace_root) const -> DriverConfigFile;

 private:
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace pkgdriver
