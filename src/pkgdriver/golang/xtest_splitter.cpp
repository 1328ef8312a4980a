#include "pkgdriver/golang/xtest_splitter.hpp"

#include <algorithm>
#include <string>
#include <unordered_set>
#include <vector>

#include "pkgdriver/core/identifier.hpp"

namespace pkgdriver::golang {

namespace {

constexpr std::string_view kTestFileSuffix = "_test.go";
constexpr std::string_view kTestPackageSuffix = "_test";

void RemoveFiles(
    std::vector<std::string>& files,
    const std::unordered_set<std::string>& moved) {
  std::erase_if(files, [&moved](const auto& file) {
    return moved.contains(file);
  });
}

}  // namespace

XTestSplitter::XTestSplitter(
    std::shared_ptr<const GoSourceScanner> source_scanner,
    std::shared_ptr<spdlog::logger> logger)
    : source_scanner_(std::move(source_scanner)),
      logger_(logger ? logger : spdlog::default_logger()) {
}

auto XTestSplitter::SplitExternalTests(PackageNode& node) const
    -> std::optional<PackageNode> {
  std::vector<std::string> xtest_files;
  std::vector<std::string> xtest_imports;
  std::string package_name = node.name;

  for (const auto& file : node.SourceFiles()) {
    if (!file.ends_with(kTestFileSuffix)) {
      continue;
    }
    auto header = source_scanner_->ScanFile(file);
    if (!header) {
      logger_->debug(
          "XTestSplitter leaving unreadable test file in {}: {}", node.id,
          header.error().message());
      continue;
    }
    if (!header->package_name.ends_with(kTestPackageSuffix)) {
      continue;
    }
    if (package_name.empty()) {
      package_name = header->package_name.substr(
          0, header->package_name.size() - kTestPackageSuffix.size());
    }
    xtest_files.push_back(file);
    for (auto& import_path : header->imports) {
      if (std::ranges::find(xtest_imports, import_path) == xtest_imports.end()) {
        xtest_imports.push_back(std::move(import_path));
      }
    }
  }

  if (xtest_files.empty()) {
    return std::nullopt;
  }

  PackageNode xtest;
  xtest.id = node.id + std::string(kXTestSuffix);
  xtest.name = package_name + std::string(kTestPackageSuffix);
  xtest.pkg_path = node.pkg_path + std::string(kTestPackageSuffix);
  xtest.go_files = xtest_files;
  xtest.compiled_go_files = xtest_files;
  xtest.other_files = node.other_files;
  xtest.standard = node.standard;
  xtest.synthesized_test = true;

  for (const auto& import_path : xtest_imports) {
    if (import_path == node.pkg_path) {
      xtest.imports[import_path] = node.id;
    } else if (auto it = node.imports.find(import_path);
               it != node.imports.end()) {
      xtest.imports[import_path] = it->second;
    } else {
      xtest.imports[import_path] = std::nullopt;
    }
  }

  // A package cannot import itself, so a self edge came from the moved files
  const std::unordered_set<std::string> moved(
      xtest_files.begin(), xtest_files.end());
  RemoveFiles(node.go_files, moved);
  RemoveFiles(node.compiled_go_files, moved);
  node.imports.erase(node.pkg_path);

  logger_->debug(
      "XTestSplitter moved {} files from {} to {}", xtest_files.size(),
      node.id, xtest.id);
  return xtest;
}

}  // namespace pkgdriver::golang
