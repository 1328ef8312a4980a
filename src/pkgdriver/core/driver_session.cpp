#include "pkgdriver/core/driver_session.hpp"

#include <unordered_set>

#include "pkgdriver/golang/build_tag_filter.hpp"
#include "pkgdriver/golang/path_resolver.hpp"
#include "pkgdriver/golang/xtest_splitter.hpp"
#include "pkgdriver/utils/scoped_timer.hpp"

namespace pkgdriver {

DriverSession::DriverSession(
    std::filesystem::path workspace_root, DriverConfigFile config,
    std::shared_ptr<spdlog::logger> logger)
    : workspace_root_(std::move(workspace_root)),
      config_(std::move(config)),
      registry_(
          RegistryOptions{.stdlib_root_label = config_.GetBazel().stdlib_label},
          logger),
      loader_(logger),
      list_provider_(std::make_shared<PackageListProvider>(logger)),
      scan_provider_(std::make_shared<OutputScanProvider>(logger)),
      source_scanner_(std::make_shared<golang::GoSourceScanner>(logger)),
      logger_(logger ? logger : spdlog::default_logger()) {
}

auto DriverSession::Load() -> std::expected<void, DriverError> {
  utils::ScopedTimer timer("Session load", logger_, spdlog::level::info);

  // 1. Standard library packages come from a separate producer and are
  // registered as-is
  for (const auto& stdlib_file : config_.GetStdlibFiles()) {
    auto nodes = loader_.LoadFile(workspace_root_ / stdlib_file);
    if (!nodes) {
      return std::unexpected(nodes.error());
    }
    logger_->debug(
        "DriverSession: {} stdlib packages from {}", nodes->size(),
        stdlib_file.string());
    registry_.Add(std::move(*nodes));
  }

  // 2. Target packages may report the same package path more than once
  auto package_files = DiscoverPackageFiles();
  for (const auto& package_file : package_files) {
    auto nodes = loader_.LoadFile(package_file);
    if (!nodes) {
      return std::unexpected(nodes.error());
    }
    for (auto& node : *nodes) {
      registry_.Update(std::move(node));
    }
  }
  logger_->debug(
      "DriverSession: registered {} packages from {} files", registry_.Size(),
      package_files.size());

  // 3. Rewrite placeholder paths and drop files for other platforms
  const auto& bazel = config_.GetBazel();
  const auto& build = config_.GetBuild();
  golang::GoosGoarchFilter filter(build.goos, build.goarch, logger_);
  if (auto resolved = registry_.ResolvePaths(
          golang::MakeBazelPathResolver(
              bazel.exec_root, bazel.output_base, logger_),
          filter);
      !resolved) {
    return resolved;
  }

  // 4. Backfill stdlib edges and split external tests
  golang::GoImportScanner import_scanner(source_scanner_, logger_);
  golang::XTestSplitter splitter(source_scanner_, logger_);
  return registry_.ResolveImports(import_scanner, splitter);
}

auto DriverSession::Run(
    const std::vector<std::string>& roots, QueryMode mode) const
    -> QueryResult {
  switch (mode) {
    case QueryMode::kMatch:
      return registry_.Match(roots);
    case QueryMode::kQuery:
      break;
  }
  return registry_.Query(roots);
}

auto DriverSession::DiscoverPackageFiles() const
    -> std::vector<std::filesystem::path> {
  std::vector<std::filesystem::path> all_files =
      list_provider_->DiscoverFiles(workspace_root_, config_);
  auto scanned = scan_provider_->DiscoverFiles(workspace_root_, config_);
  all_files.insert(all_files.end(), scanned.begin(), scanned.end());

  // Same file listed twice would only merge with itself
  std::unordered_set<std::string> seen;
  std::vector<std::filesystem::path> unique_files;
  for (auto& file : all_files) {
    if (seen.insert(file.lexically_normal().string()).second) {
      unique_files.push_back(std::move(file));
    }
  }
  return unique_files;
}

}  // namespace pkgdriver
