#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

namespace pkgdriver {

// Represents the contents of a .pkgdriver configuration file
class DriverConfigFile {
  using RelativePath = std::filesystem::path;

 public:
  // Where package JSON files come from
  struct PackageFiles {
    // List files naming one package JSON file per line
    std::vector<RelativePath> lists;
    // Directories searched recursively for *.pkg.json
    std::vector<RelativePath> scan_dirs;
  };

  // Bazel workspace facts used for path rewriting and label matching
  struct BazelSettings {
    std::string exec_root;
    std::string output_base;
    std::string stdlib_label;
  };

  // Active build configuration for file filtering
  struct BuildSettings {
    std::string goos = "linux";
    std::string goarch = "amd64";
  };

  // Constructor with optional logger
  explicit DriverConfigFile(std::shared_ptr<spdlog::logger> logger = nullptr);

  // Configuration used when no .pkgdriver file is present
  static auto CreateDefault(std::shared_ptr<spdlog::logger> logger = nullptr)
      -> DriverConfigFile;

  // Load a configuration from a .pkgdriver file
  // Returns std::nullopt if file doesn't exist or has parsing errors
  static auto LoadFromFile(
      const std::filesystem::path& config_path,
      std::shared_ptr<spdlog::logger> logger = nullptr)
      -> std::optional<DriverConfigFile>;

  [[nodiscard]] auto GetPackageFiles() const -> const PackageFiles& {
    return package_files_;
  }

  [[nodiscard]] auto GetStdlibFiles() const
      -> const std::vector<RelativePath>& {
    return stdlib_files_;
  }

  [[nodiscard]] auto GetBazel() const -> const BazelSettings& {
    return bazel_;
  }

  [[nodiscard]] auto GetBuild() const -> const BuildSettings& {
    return build_;
  }

  [[nodiscard]] auto HasPackageSources() const -> bool {
    return !package_files_.lists.empty() || !package_files_.scan_dirs.empty() ||
           !stdlib_files_.empty();
  }

 private:
  std::shared_ptr<spdlog::logger> logger_;

  PackageFiles package_files_;
  std::vector<RelativePath> stdlib_files_;
  BazelSettings bazel_;
  BuildSettings build_;
};

}  // namespace pkgdriver
