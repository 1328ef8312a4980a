#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

#include "pkgdriver/core/collaborators.hpp"

namespace pkgdriver::golang {

// Placeholders the package JSON producer writes instead of absolute paths
inline constexpr std::string_view kExecRootPlaceholder = "__BAZEL_EXECROOT__";
inline constexpr std::string_view kOutputBasePlaceholder =
    "__BAZEL_OUTPUT_BASE__";

// Build a resolver substituting the first occurrence of each placeholder.
// Paths without placeholders are returned unchanged. A placeholder whose
// value is empty is left in place, and a warning is logged once.
[[nodiscard]] auto MakeBazelPathResolver(
    std::string exec_root, std::string output_base,
    std::shared_ptr<spdlog::logger> logger = nullptr) -> PathResolverFn;

}  // namespace pkgdriver::golang
