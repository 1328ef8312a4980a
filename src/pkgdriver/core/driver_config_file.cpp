#include "pkgdriver/core/driver_config_file.hpp"

#include <yaml-cpp/yaml.h>

#include "pkgdriver/core/identifier.hpp"

namespace pkgdriver {

namespace {

// Accept both a single scalar and a sequence of scalars
auto ReadPathList(const YAML::Node& node)
    -> std::vector<std::filesystem::path> {
  std::vector<std::filesystem::path> paths;
  if (node.IsScalar()) {
    paths.emplace_back(node.as<std::string>());
  } else if (node.IsSequence()) {
    for (const auto& item : node) {
      paths.emplace_back(item.as<std::string>());
    }
  }
  return paths;
}

}  // namespace

DriverConfigFile::DriverConfigFile(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? logger : spdlog::default_logger()) {
  bazel_.stdlib_label = std::string(kDefaultStdlibRootLabel);
}

auto DriverConfigFile::CreateDefault(std::shared_ptr<spdlog::logger> logger)
    -> DriverConfigFile {
  return DriverConfigFile(std::move(logger));
}

auto DriverConfigFile::LoadFromFile(
    const std::filesystem::path& config_path,
    std::shared_ptr<spdlog::logger> logger) -> std::optional<DriverConfigFile> {
  DriverConfigFile config(logger);

  if (!std::filesystem::exists(config_path)) {
    config.logger_->debug(
        "No .pkgdriver configuration file found at {}", config_path.string());
    return std::nullopt;
  }

  try {
    YAML::Node yaml = YAML::LoadFile(config_path.string());

    // Parse PackageFiles section
    if (yaml["PackageFiles"]) {
      const auto& package_files = yaml["PackageFiles"];
      if (package_files["Lists"]) {
        config.package_files_.lists = ReadPathList(package_files["Lists"]);
      }
      if (package_files["ScanDirs"]) {
        config.package_files_.scan_dirs =
            ReadPathList(package_files["ScanDirs"]);
      }
      config.logger_->debug(
          "Loaded PackageFiles: {} lists, {} scan dirs",
          config.package_files_.lists.size(),
          config.package_files_.scan_dirs.size());
    }

    if (yaml["StdlibFiles"]) {
      config.stdlib_files_ = ReadPathList(yaml["StdlibFiles"]);
    }

    // Parse Bazel section
    if (yaml["Bazel"]) {
      const auto& bazel = yaml["Bazel"];
      if (bazel["ExecRoot"]) {
        config.bazel_.exec_root = bazel["ExecRoot"].as<std::string>();
      }
      if (bazel["OutputBase"]) {
        config.bazel_.output_base = bazel["OutputBase"].as<std::string>();
      }
      if (bazel["StdlibLabel"]) {
        config.bazel_.stdlib_label = bazel["StdlibLabel"].as<std::string>();
      }
    }

    // Parse Build section
    if (yaml["Build"]) {
      const auto& build = yaml["Build"];
      if (build["GOOS"]) {
        config.build_.goos = build["GOOS"].as<std::string>();
      }
      if (build["GOARCH"]) {
        config.build_.goarch = build["GOARCH"].as<std::string>();
      }
      config.logger_->debug(
          "Loaded Build: {}/{}", config.build_.goos, config.build_.goarch);
    }

    config.logger_->debug(
        "Loaded .pkgdriver configuration from {}", config_path.string());
    return config;

  } catch (const YAML::Exception& e) {
    config.logger_->error(
        "Error parsing .pkgdriver configuration file: {}", e.what());
    return std::nullopt;
  }
}

}  // namespace pkgdriver
