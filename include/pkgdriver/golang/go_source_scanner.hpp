#pragma once

#include <expected>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

#include "pkgdriver/core/collaborators.hpp"
#include "pkgdriver/error/error.hpp"

namespace pkgdriver::golang {

// Package clause and import declarations at the top of a Go source file
struct GoFileHeader {
  std::string package_name;
  std::vector<std::string> imports;
};

// GoSourceScanner reads only the header of Go files: the package clause and
// the import declarations that must precede every other declaration.
class GoSourceScanner {
 public:
  explicit GoSourceScanner(std::shared_ptr<spdlog::logger> logger = nullptr);

  [[nodiscard]] auto ScanFile(const std::filesystem::path& path) const
      -> std::expected<GoFileHeader, DriverError>;

  // Parse header from source text. The error is a human-readable reason.
  [[nodiscard]] static auto ParseHeader(std::string_view source)
      -> std::expected<GoFileHeader, std::string>;

 private:
  std::shared_ptr<spdlog::logger> logger_;
};

// ImportScanner over a node's compiled sources. Imports are reported once,
// in order of first appearance.
class GoImportScanner : public ImportScanner {
 public:
  explicit GoImportScanner(
      std::shared_ptr<const GoSourceScanner> source_scanner,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  [[nodiscard]] auto ScanImports(const PackageNode& node) const
      -> std::expected<std::vector<std::string>, DriverError> override;

 private:
  std::shared_ptr<const GoSourceScanner> source_scanner_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace pkgdriver::golang
