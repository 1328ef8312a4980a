#pragma once

#include <memory>
#include <optional>

#include <spdlog/spdlog.h>

#include "pkgdriver/core/collaborators.hpp"
#include "pkgdriver/golang/go_source_scanner.hpp"

namespace pkgdriver::golang {

// XTestSplitter moves black-box test files (`*_test.go` declaring package
// `<name>_test`) out of a package into a synthetic `<id>_xtest` package.
class XTestSplitter : public TestSplitter {
 public:
  explicit XTestSplitter(
      std::shared_ptr<const GoSourceScanner> source_scanner,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  [[nodiscard]] auto SplitExternalTests(PackageNode& node) const
      -> std::optional<PackageNode> override;

 private:
  std::shared_ptr<const GoSourceScanner> source_scanner_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace pkgdriver::golang
