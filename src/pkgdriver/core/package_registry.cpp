#include "pkgdriver/core/package_registry.hpp"

#include <set>

#include <fmt/format.h>

#include "pkgdriver/utils/scoped_timer.hpp"

namespace pkgdriver {

namespace {

// cgo pseudo-package, never a real dependency
constexpr std::string_view kCgoImport = "C";

}  // namespace

void to_json(nlohmann::json& j, const QueryResult& result) {
  nlohmann::json diagnostics = nlohmann::json::array();
  for (const auto& diagnostic : result.diagnostics) {
    diagnostics.push_back(
        {{"Root", diagnostic.root}, {"Message", diagnostic.message}});
  }

  j = nlohmann::json{
      {"Roots", result.roots},
      {"Packages", result.packages},
      {"Diagnostics", std::move(diagnostics)},
  };
}

PackageRegistry::PackageRegistry(
    RegistryOptions options, std::shared_ptr<spdlog::logger> logger)
    : options_(std::move(options)),
      logger_(logger ? logger : spdlog::default_logger()) {
}

auto PackageRegistry::Add(std::vector<PackageNode> nodes) -> PackageRegistry& {
  for (auto& node : nodes) {
    RewritePackage(node);
    Insert(std::move(node));
  }
  return *this;
}

void PackageRegistry::Update(PackageNode node) {
  auto it = index_by_path_.find(node.pkg_path);
  if (it == index_by_path_.end()) {
    RewritePackage(node);
    Insert(std::move(node));
    return;
  }

  auto& existing = nodes_[it->second];
  if (IsSuperset(node.go_files, existing.go_files)) {
    logger_->debug(
        "PackageRegistry: merging {} files into {} ({} before)",
        node.go_files.size(), existing.pkg_path, existing.go_files.size());
    existing.go_files = std::move(node.go_files);
  } else {
    logger_->debug(
        "PackageRegistry: keeping existing files of {}, incoming list is not "
        "a superset",
        existing.pkg_path);
  }
}

auto PackageRegistry::ResolvePaths(
    const PathResolverFn& resolver, const BuildTagFilter& filter)
    -> std::expected<void, DriverError> {
  utils::ScopedTimer timer("Path resolution", logger_);

  auto resolve_all = [&resolver](std::vector<std::string>& files) {
    for (auto& file : files) {
      file = resolver(file);
    }
  };

  for (auto& node : nodes_) {
    try {
      resolve_all(node.go_files);
      resolve_all(node.compiled_go_files);
      resolve_all(node.other_files);
      if (!node.export_file.empty()) {
        node.export_file = resolver(node.export_file);
      }
    } catch (const std::exception& e) {
      logger_->error(
          "PackageRegistry: failed to resolve paths of {}: {}", node.id,
          e.what());
      return DriverError::Unexpected(
          DriverErrorCode::PathResolutionFailed,
          fmt::format("{}: {}", node.id, e.what()));
    }
    filter.FilterFiles(node);
  }

  return {};
}

auto PackageRegistry::ResolveImports(
    const ImportScanner& scanner, const TestSplitter& splitter)
    -> std::expected<void, DriverError> {
  utils::ScopedTimer timer("Import resolution", logger_);

  // Nodes split off below are complete and must not be scanned again
  const size_t node_count = nodes_.size();
  size_t resolved_edges = 0;

  for (NodeIndex index = 0; index < node_count; ++index) {
    // Stdlib records already list all of their imports
    if (!nodes_[index].IsStdlib()) {
      auto scanned = scanner.ScanImports(nodes_[index]);
      if (!scanned) {
        logger_->error(
            "PackageRegistry: import scan of {} failed: {}", nodes_[index].id,
            scanned.error().message());
        return std::unexpected(scanned.error());
      }
      for (auto& import_path : *scanned) {
        if (import_path == kCgoImport) {
          continue;
        }
        nodes_[index].imports.try_emplace(std::move(import_path), std::nullopt);
      }
    }

    for (auto& [path, target] : nodes_[index].imports) {
      if (target.has_value()) {
        continue;
      }
      if (auto it = stdlib_index_.find(path); it != stdlib_index_.end()) {
        target = it->second;
        ++resolved_edges;
      }
    }

    // Store() may grow the arena, so no reference into it is held here
    if (auto xtest = splitter.SplitExternalTests(nodes_[index])) {
      logger_->debug(
          "PackageRegistry: split external tests of {} into {}",
          nodes_[index].id, xtest->id);
      auto key = xtest->id;
      Store(std::move(key), std::move(*xtest));
    }
  }

  logger_->debug(
      "PackageRegistry: resolved {} stdlib import edges", resolved_edges);
  return {};
}

auto PackageRegistry::Query(const std::vector<std::string>& queries) const
    -> QueryResult {
  return Walk(queries);
}

auto PackageRegistry::Match(const std::vector<std::string>& labels) const
    -> QueryResult {
  std::set<std::string> roots;

  for (const auto& raw_label : labels) {
    // Labels without a repository anchor use the pre-canonical syntax
    auto label = raw_label.starts_with(kLabelAnchor)
                     ? raw_label
                     : std::string(kLabelAnchor) + raw_label;

    if (label == options_.stdlib_root_label) {
      // The stdlib label never appears in the package data itself
      for (const auto& node : nodes_) {
        if (node.IsStdlib()) {
          roots.insert(node.id);
        }
      }
      continue;
    }

    auto xtest_label = label + std::string(kXTestSuffix);
    roots.insert(std::move(label));
    if (Find(xtest_label) != nullptr) {
      roots.insert(std::move(xtest_label));
    }
  }

  return Walk(std::vector<std::string>(roots.begin(), roots.end()));
}

auto PackageRegistry::Find(std::string_view key) const -> const PackageNode* {
  auto it = index_by_path_.find(std::string(key));
  if (it == index_by_path_.end()) {
    return nullptr;
  }
  return &nodes_[it->second];
}

auto PackageRegistry::StdlibIdentity(std::string_view pkg_path) const
    -> std::optional<std::string> {
  auto it = stdlib_index_.find(std::string(pkg_path));
  if (it == stdlib_index_.end()) {
    return std::nullopt;
  }
  return it->second;
}

auto PackageRegistry::Store(std::string key, PackageNode node) -> NodeIndex {
  if (auto it = index_by_path_.find(key); it != index_by_path_.end()) {
    nodes_[it->second] = std::move(node);
    return it->second;
  }
  nodes_.push_back(std::move(node));
  const NodeIndex index = nodes_.size() - 1;
  index_by_path_.emplace(std::move(key), index);
  return index;
}

void PackageRegistry::Insert(PackageNode node) {
  if (node.IsStdlib()) {
    stdlib_index_[node.pkg_path] = node.id;
  } else {
    stdlib_index_.erase(node.pkg_path);
  }
  auto key = node.pkg_path;
  Store(std::move(key), std::move(node));
}

auto PackageRegistry::Walk(const std::vector<std::string>& roots) const
    -> QueryResult {
  DiagnosticCollector collector;
  ReachabilityWalker walker(
      [this](std::string_view key) { return Find(key); }, collector.Sink());

  VisitedMap visited;
  for (const auto& root : roots) {
    walker.Walk(visited, root);
  }

  QueryResult result;
  result.roots = roots;
  result.packages.reserve(visited.size());
  for (const auto& [id, node] : visited) {
    result.packages.push_back(*node);
  }
  result.diagnostics = collector.Take();

  for (const auto& diagnostic : result.diagnostics) {
    logger_->warn(
        "PackageRegistry: {} (root: {})", diagnostic.message, diagnostic.root);
  }
  logger_->debug(
      "PackageRegistry: {} roots reach {} packages", result.roots.size(),
      result.packages.size());

  return result;
}

}  // namespace pkgdriver
