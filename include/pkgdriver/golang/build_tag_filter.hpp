#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

#include "pkgdriver/core/collaborators.hpp"

namespace pkgdriver::golang {

// GoosGoarchFilter drops files whose name is constrained to another platform
// through the _GOOS, _GOARCH or _GOOS_GOARCH suffix convention. Build
// constraint comments inside the files are not evaluated.
class GoosGoarchFilter : public BuildTagFilter {
 public:
  GoosGoarchFilter(
      std::string goos, std::string goarch,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  void FilterFiles(PackageNode& node) const override;

  // Whether a file name applies to the configured platform
  [[nodiscard]] auto MatchFile(std::string_view file_name) const -> bool;

 private:
  [[nodiscard]] auto MatchTag(std::string_view tag) const -> bool;

  std::string goos_;
  std::string goarch_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace pkgdriver::golang
