#pragma once

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "pkgdriver/core/package_node.hpp"

namespace pkgdriver {

// Non-fatal condition found while walking, e.g. a root that is not registered
struct WalkDiagnostic {
  std::string root;
  std::string message;

  friend auto operator==(const WalkDiagnostic&, const WalkDiagnostic&)
      -> bool = default;
};

// Visited set: identity -> node
using VisitedMap = std::map<std::string, const PackageNode*>;

using NodeLookupFn = std::function<const PackageNode*(std::string_view)>;
using DiagnosticSink = std::function<void(const WalkDiagnostic&)>;

// ReachabilityWalker computes the closure of packages importable from a root.
// Lookups go through `lookup`, so the walker can run over any node store.
class ReachabilityWalker {
 public:
  ReachabilityWalker(NodeLookupFn lookup, DiagnosticSink sink);

  // Depth-first walk from `root` into the shared `visited` map. Any identity
  // that cannot be found (the root or an import target) is reported to the
  // sink and skipped. Unresolved edges are ignored and visited identities are
  // never descended into again.
  void Walk(VisitedMap& visited, std::string_view root) const;

 private:
  NodeLookupFn lookup_;
  DiagnosticSink sink_;
};

// Accumulates diagnostics so callers can return them with the query result
class DiagnosticCollector {
 public:
  [[nodiscard]] auto Sink() -> DiagnosticSink {
    return [this](const WalkDiagnostic& diagnostic) {
      diagnostics_.push_back(diagnostic);
    };
  }

  [[nodiscard]] auto Diagnostics() const
      -> const std::vector<WalkDiagnostic>& {
    return diagnostics_;
  }

  auto Take() -> std::vector<WalkDiagnostic> {
    return std::move(diagnostics_);
  }

 private:
  std::vector<WalkDiagnostic> diagnostics_;
};

}  // namespace pkgdriver
