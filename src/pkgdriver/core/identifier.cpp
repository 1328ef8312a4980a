#include "pkgdriver/core/identifier.hpp"

namespace pkgdriver {

auto CanonicalizeImportId(
    std::string_view path, std::string_view id, const PackageNode& importer)
    -> std::string {
  if (id.starts_with(kStdlibIdPrefix)) {
    return std::string(id.substr(kStdlibIdPrefix.size()));
  }
  if (importer.IsStdlib()) {
    return std::string(id);
  }
  return std::string(path);
}

void RewritePackage(PackageNode& node) {
  node.id = node.pkg_path;
  for (auto& [path, target] : node.imports) {
    auto canonical = CanonicalizeImportId(path, target.value_or(""), node);
    if (canonical.empty()) {
      target = std::nullopt;
    } else {
      target = std::move(canonical);
    }
  }
}

auto IsSuperset(
    const std::vector<std::string>& a, const std::vector<std::string>& b)
    -> bool {
  if (a.size() < b.size()) {
    return false;
  }
  if (b.empty()) {
    return true;
  }

  size_t bi = 0;
  for (const auto& item : a) {
    if (item == b[bi]) {
      ++bi;
      if (bi == b.size()) {
        return true;
      }
    }
  }
  return false;
}

}  // namespace pkgdriver
