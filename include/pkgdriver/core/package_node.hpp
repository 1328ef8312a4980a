#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace pkgdriver {

// Target of an import edge. std::nullopt marks an edge whose package lies
// outside the known universe; an empty string is never stored.
using ImportTarget = std::optional<std::string>;

// Import path -> target identity
using ImportMap = std::map<std::string, ImportTarget>;

// PackageNode describes one compilation unit as reported by the build tool's
// introspection output. Nodes are produced by PackageLoader (or by tests) and
// then owned by the PackageRegistry arena.
struct PackageNode {
  // Canonical identity used as the target of import edges
  std::string id;

  // Go package name, may be empty until a source file is scanned
  std::string name;

  // Logical path, the registry key
  std::string pkg_path;

  // Source files in producer order (order is significant for merging)
  std::vector<std::string> go_files;
  std::vector<std::string> compiled_go_files;
  std::vector<std::string> other_files;

  std::string export_file;

  ImportMap imports;

  bool standard = false;

  // Set on nodes created by splitting external test files out of a package
  bool synthesized_test = false;

  [[nodiscard]] auto IsStdlib() const -> bool {
    return standard;
  }

  // Union of go_files and compiled_go_files in first-seen order. Merged
  // records only extend go_files, so neither list alone is complete.
  [[nodiscard]] auto SourceFiles() const -> std::vector<std::string>;
};

// JSON encoding uses the field names of the rules_go package records.
// Unresolved import edges are omitted on output; empty or null targets decode
// to std::nullopt.
void to_json(nlohmann::json& j, const PackageNode& node);
void from_json(const nlohmann::json& j, PackageNode& node);

}  // namespace pkgdriver
