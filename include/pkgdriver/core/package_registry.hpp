#pragma once

#include <cstddef>
#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <spdlog/spdlog.h>

#include "pkgdriver/core/collaborators.hpp"
#include "pkgdriver/core/identifier.hpp"
#include "pkgdriver/core/package_node.hpp"
#include "pkgdriver/core/reachability_walker.hpp"
#include "pkgdriver/error/error.hpp"

namespace pkgdriver {

// Result of Query() and Match()
struct QueryResult {
  std::vector<std::string> roots;

  // Union of everything reachable from the roots, sorted by identity
  std::vector<PackageNode> packages;

  std::vector<WalkDiagnostic> diagnostics;
};

void to_json(nlohmann::json& j, const QueryResult& result);

struct RegistryOptions {
  std::string stdlib_root_label = std::string(kDefaultStdlibRootLabel);
};

// PackageRegistry owns every package node of one driver session.
//
// Nodes live in an arena and are addressed by a stable NodeIndex; each
// resolution pass updates its slot in place. The registry is single-threaded
// and carries no locking.
class PackageRegistry {
 public:
  using NodeIndex = std::size_t;

  explicit PackageRegistry(
      RegistryOptions options = {},
      std::shared_ptr<spdlog::logger> logger = nullptr);

  // Canonicalize and register nodes. A node whose logical path is already
  // registered replaces the previous record.
  auto Add(std::vector<PackageNode> nodes) -> PackageRegistry&;

  // Register a node, reconciling with an existing registration of the same
  // logical path: the incoming file list wins only when it contains the
  // existing one as an ordered subsequence. No other field is merged.
  void Update(PackageNode node);

  // Rewrite every node's paths through `resolver` and drop files that do not
  // apply to the active build configuration.
  auto ResolvePaths(const PathResolverFn& resolver, const BuildTagFilter& filter)
      -> std::expected<void, DriverError>;

  // Backfill standard library import edges and split external test packages
  // into their own nodes. Stops at the first scanner failure.
  auto ResolveImports(const ImportScanner& scanner, const TestSplitter& splitter)
      -> std::expected<void, DriverError>;

  // Closure over caller-supplied package identities used verbatim
  [[nodiscard]] auto Query(const std::vector<std::string>& queries) const
      -> QueryResult;

  // Closure over build labels, expanding the stdlib label and adding xtest
  // companions
  [[nodiscard]] auto Match(const std::vector<std::string>& labels) const
      -> QueryResult;

  [[nodiscard]] auto Find(std::string_view key) const -> const PackageNode*;

  [[nodiscard]] auto Size() const -> size_t {
    return index_by_path_.size();
  }

  [[nodiscard]] auto StdlibIdentity(std::string_view pkg_path) const
      -> std::optional<std::string>;

 private:
  // Store `node` under `key`, reusing the slot of a previous registration
  auto Store(std::string key, PackageNode node) -> NodeIndex;

  // Register an already canonicalized node
  void Insert(PackageNode node);

  [[nodiscard]] auto Walk(const std::vector<std::string>& roots) const
      -> QueryResult;

  RegistryOptions options_;

  std::vector<PackageNode> nodes_;
  std::unordered_map<std::string, NodeIndex> index_by_path_;

  // Logical path -> identity of standard library nodes
  std::unordered_map<std::string, std::string> stdlib_index_;

  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace pkgdriver
