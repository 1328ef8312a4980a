#pragma once

#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "pkgdriver/core/package_node.hpp"
#include "pkgdriver/error/error.hpp"

namespace pkgdriver {

// Maps a build-relative path reported by the producer to a filesystem path
using PathResolverFn = std::function<std::string(std::string_view)>;

// BuildTagFilter removes files that do not apply to the active build
// configuration. Invoked on every node right after path resolution.
class BuildTagFilter {
 public:
  BuildTagFilter() = default;
  BuildTagFilter(const BuildTagFilter&) = default;
  BuildTagFilter(BuildTagFilter&&) = delete;
  auto operator=(const BuildTagFilter&) -> BuildTagFilter& = default;
  auto operator=(BuildTagFilter&&) -> BuildTagFilter& = delete;
  virtual ~BuildTagFilter() = default;

  virtual void FilterFiles(PackageNode& node) const = 0;
};

// ImportScanner reports the import paths a package's sources declare.
// Failure aborts the whole import resolution pass.
class ImportScanner {
 public:
  ImportScanner() = default;
  ImportScanner(const ImportScanner&) = default;
  ImportScanner(ImportScanner&&) = delete;
  auto operator=(const ImportScanner&) -> ImportScanner& = default;
  auto operator=(ImportScanner&&) -> ImportScanner& = delete;
  virtual ~ImportScanner() = default;

  [[nodiscard]] virtual auto ScanImports(const PackageNode& node) const
      -> std::expected<std::vector<std::string>, DriverError> = 0;
};

// TestSplitter moves black-box test files out of a package. Returns the
// synthetic xtest node, or std::nullopt when there is nothing to split.
class TestSplitter {
 public:
  TestSplitter() = default;
  TestSplitter(const TestSplitter&) = default;
  TestSplitter(TestSplitter&&) = delete;
  auto operator=(const TestSplitter&) -> TestSplitter& = default;
  auto operator=(TestSplitter&&) -> TestSplitter& = delete;
  virtual ~TestSplitter() = default;

  [[nodiscard]] virtual auto SplitExternalTests(PackageNode& node) const
      -> std::optional<PackageNode> = 0;
};

}  // namespace pkgdriver
