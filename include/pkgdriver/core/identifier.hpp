#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "pkgdriver/core/package_node.hpp"

namespace pkgdriver {

// Decoration rules_go puts around standard library package identifiers
inline constexpr std::string_view kStdlibIdPrefix =
    "@@io_bazel_rules_go//stdlib:";

// Label that stands for the whole standard library in Match()
inline constexpr std::string_view kDefaultStdlibRootLabel =
    "@io_bazel_rules_go//:stdlib";

inline constexpr std::string_view kLabelAnchor = "@";
inline constexpr std::string_view kXTestSuffix = "_xtest";

// Compute the identity stored as the target of the import `path` -> `id`
// declared by `importer`.
//   - stdlib-decorated ids are unwrapped to the bare package path
//   - stdlib importers keep the build tool's own ids
//   - everything else is keyed by the import path
[[nodiscard]] auto CanonicalizeImportId(
    std::string_view path, std::string_view id, const PackageNode& importer)
    -> std::string;

// Force node.id to its logical path and canonicalize every import edge in
// place. An unresolved edge is canonicalized like an empty id: it becomes the
// import path in a non-stdlib node and stays unresolved in a stdlib node.
void RewritePackage(PackageNode& node);

// Returns true if `b` is an order-preserving subsequence of `a`
[[nodiscard]] auto IsSuperset(
    const std::vector<std::string>& a, const std::vector<std::string>& b)
    -> bool;

}  // namespace pkgdriver
