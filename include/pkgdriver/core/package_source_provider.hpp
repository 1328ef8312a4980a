#pragma once

#include <filesystem>
#include <memory>
#include <vector>

#include <spdlog/spdlog.h>

#include "pkgdriver/core/driver_config_file.hpp"

namespace pkgdriver {

// PackageSourceProviderBase defines how package JSON files are located:
// - PackageListProvider: reads list files named in the config
// - OutputScanProvider: scans build output directories for *.pkg.json
class PackageSourceProviderBase {
 public:
  PackageSourceProviderBase() = default;
  PackageSourceProviderBase(const PackageSourceProviderBase&) = default;
  PackageSourceProviderBase(PackageSourceProviderBase&&) = delete;
  auto operator=(const PackageSourceProviderBase&)
      -> PackageSourceProviderBase& = default;
  auto operator=(PackageSourceProviderBase&&)
      -> PackageSourceProviderBase& = delete;
  virtual ~PackageSourceProviderBase() = default;

  // Returns package JSON paths; relative config entries resolve against
  // workspace_root
  [[nodiscard]] virtual auto DiscoverFiles(
      const std::filesystem::path& workspace_root,
      const DriverConfigFile& config) const
      -> std::vector<std::filesystem::path> = 0;
};

class PackageListProvider : public PackageSourceProviderBase {
 public:
  explicit PackageListProvider(
      std::shared_ptr<spdlog::logger> logger = nullptr);

  [[nodiscard]] auto DiscoverFiles(
      const std::filesystem::path& workspace_root,
      const DriverConfigFile& config) const
      -> std::vector<std::filesystem::path> override;

  // Read one list file: one path per line, '#' comments, trailing '\'
  // continues a line, relative entries resolve against the list's directory
  [[nodiscard]] auto ProcessPackageList(
      const std::filesystem::path& list_path) const
      -> std::vector<std::filesystem::path>;

 private:
  std::shared_ptr<spdlog::logger> logger_;
};

class OutputScanProvider : public PackageSourceProviderBase {
 public:
  explicit OutputScanProvider(std::shared_ptr<spdlog::logger> logger = nullptr);

  [[nodiscard]] auto DiscoverFiles(
      const std::filesystem::path& workspace_root,
      const DriverConfigFile& config) const
      -> std::vector<std::filesystem::path> override;

 private:
  [[nodiscard]] auto FindPackageFilesInDirectory(
      const std::filesystem::path& directory) const
      -> std::vector<std::filesystem::path>;

  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace pkgdriver
