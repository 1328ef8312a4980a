#pragma once

#include <expected>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "pkgdriver/core/driver_config_file.hpp"
#include "pkgdriver/core/package_loader.hpp"
#include "pkgdriver/core/package_registry.hpp"
#include "pkgdriver/core/package_source_provider.hpp"
#include "pkgdriver/error/error.hpp"
#include "pkgdriver/golang/go_source_scanner.hpp"

namespace pkgdriver {

enum class QueryMode {
  // Roots are package identities used verbatim
  kQuery,
  // Roots are build labels
  kMatch,
};

// DriverSession runs one request end to end: it loads package JSON into a
// fresh registry, resolves paths and imports, and answers the query. A
// session is used once and discarded.
class DriverSession {
 public:
  DriverSession(
      std::filesystem::path workspace_root, DriverConfigFile config,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  // Load and resolve every configured package. Stops at the first failure.
  auto Load() -> std::expected<void, DriverError>;

  [[nodiscard]] auto Run(
      const std::vector<std::string>& roots, QueryMode mode) const
      -> QueryResult;

  [[nodiscard]] auto GetRegistry() const -> const PackageRegistry& {
    return registry_;
  }

 private:
  // Package JSON files from every provider, first occurrence wins
  [[nodiscard]] auto DiscoverPackageFiles() const
      -> std::vector<std::filesystem::path>;

  std::filesystem::path workspace_root_;
  DriverConfigFile config_;

  PackageRegistry registry_;
  PackageLoader loader_;
  std::shared_ptr<PackageListProvider> list_provider_;
  std::shared_ptr<OutputScanProvider> scan_provider_;
  std::shared_ptr<golang::GoSourceScanner> source_scanner_;

  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace pkgdriver
