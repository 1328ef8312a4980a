#include "pkgdriver/core/package_source_provider.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <string>

namespace pkgdriver {

namespace {

constexpr std::string_view kPackageFileSuffix = ".pkg.json";

auto Trim(std::string line) -> std::string {
  while (!line.empty() &&
         (std::isspace(static_cast<unsigned char>(line.front())) != 0)) {
    line.erase(0, 1);
  }
  while (!line.empty() &&
         (std::isspace(static_cast<unsigned char>(line.back())) != 0)) {
    line.pop_back();
  }
  return line;
}

}  // namespace

// PackageListProvider implementation

PackageListProvider::PackageListProvider(
    std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? logger : spdlog::default_logger()) {
}

auto PackageListProvider::DiscoverFiles(
    const std::filesystem::path& workspace_root,
    const DriverConfigFile& config) const
    -> std::vector<std::filesystem::path> {
  std::vector<std::filesystem::path> all_files;

  for (const auto& list : config.GetPackageFiles().lists) {
    auto files = ProcessPackageList(workspace_root / list);
    all_files.insert(all_files.end(), files.begin(), files.end());
  }

  logger_->debug(
      "PackageListProvider discovered {} package files", all_files.size());
  return all_files;
}

auto PackageListProvider::ProcessPackageList(
    const std::filesystem::path& list_path) const
    -> std::vector<std::filesystem::path> {
  std::vector<std::filesystem::path> files;

  std::ifstream file(list_path);
  if (!file) {
    logger_->warn(
        "PackageListProvider failed to read package list: {}",
        list_path.string());
    return files;
  }

  std::string line;
  std::string accumulated_line;
  while (std::getline(file, line)) {
    line = Trim(std::move(line));

    // Skip empty lines and comments
    if (line.empty() || line[0] == '#') {
      continue;
    }

    // Handle line continuation
    if (line.back() == '\\') {
      accumulated_line += line.substr(0, line.size() - 1);
      continue;
    }

    accumulated_line += line;
    std::filesystem::path entry(accumulated_line);
    files.push_back(
        entry.is_absolute() ? entry : list_path.parent_path() / entry);
    accumulated_line.clear();
  }

  return files;
}

// OutputScanProvider implementation

OutputScanProvider::OutputScanProvider(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? logger : spdlog::default_logger()) {
}

auto OutputScanProvider::DiscoverFiles(
    const std::filesystem::path& workspace_root,
    const DriverConfigFile& config) const
    -> std::vector<std::filesystem::path> {
  std::vector<std::filesystem::path> all_files;

  for (const auto& dir : config.GetPackageFiles().scan_dirs) {
    auto files = FindPackageFilesInDirectory(workspace_root / dir);
    all_files.insert(all_files.end(), files.begin(), files.end());
  }

  logger_->debug(
      "OutputScanProvider discovered {} package files", all_files.size());
  return all_files;
}

auto OutputScanProvider::FindPackageFilesInDirectory(
    const std::filesystem::path& directory) const
    -> std::vector<std::filesystem::path> {
  std::vector<std::filesystem::path> package_files;

  logger_->debug(
      "OutputScanProvider scanning directory: {}", directory.string());

  try {
    for (const auto& entry : std::filesystem::recursive_directory_iterator(
             directory,
             std::filesystem::directory_options::follow_directory_symlink)) {
      if (entry.is_regular_file() &&
          entry.path().filename().string().ends_with(kPackageFileSuffix)) {
        package_files.push_back(entry.path());
      }
    }
  } catch (const std::filesystem::filesystem_error& e) {
    logger_->error(
        "OutputScanProvider error scanning directory {}: {}",
        directory.string(), e.what());
  }

  // Registration order decides merges
  std::ranges::sort(package_files);
  return package_files;
}

}  // namespace pkgdriver
