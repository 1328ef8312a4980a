#include "pkgdriver/core/reachability_walker.hpp"

#include <stack>

namespace pkgdriver {

ReachabilityWalker::ReachabilityWalker(
    NodeLookupFn lookup, DiagnosticSink sink)
    : lookup_(std::move(lookup)), sink_(std::move(sink)) {
}

void ReachabilityWalker::Walk(VisitedMap& visited, std::string_view root) const {
  // Explicit stack keeps deep import chains off the call stack
  std::stack<std::string> pending;
  pending.emplace(root);

  while (!pending.empty()) {
    auto current = std::move(pending.top());
    pending.pop();

    const auto* node = lookup_(current);
    if (node == nullptr) {
      if (sink_) {
        sink_(WalkDiagnostic{
            .root = std::move(current), .message = "package ID not found"});
      }
      continue;
    }

    if (!visited.emplace(node->id, node).second) {
      continue;
    }

    for (const auto& [path, target] : node->imports) {
      if (target.has_value() && !visited.contains(*target)) {
        pending.push(*target);
      }
    }
  }
}

}  // namespace pkgdriver
