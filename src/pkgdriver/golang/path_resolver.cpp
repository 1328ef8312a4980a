#include "pkgdriver/golang/path_resolver.hpp"

namespace pkgdriver::golang {

namespace {

void ReplaceFirst(
    std::string& path, std::string_view placeholder, const std::string& value) {
  if (value.empty()) {
    return;
  }
  if (auto pos = path.find(placeholder); pos != std::string::npos) {
    path.replace(pos, placeholder.size(), value);
  }
}

}  // namespace

auto MakeBazelPathResolver(
    std::string exec_root, std::string output_base,
    std::shared_ptr<spdlog::logger> logger) -> PathResolverFn {
  if (!logger) {
    logger = spdlog::default_logger();
  }
  if (exec_root.empty()) {
    logger->warn(
        "Bazel.ExecRoot is not configured, {} paths stay unresolved",
        kExecRootPlaceholder);
  }
  if (output_base.empty()) {
    logger->warn(
        "Bazel.OutputBase is not configured, {} paths stay unresolved",
        kOutputBasePlaceholder);
  }

  return [exec_root = std::move(exec_root),
          output_base = std::move(output_base)](std::string_view raw) {
    std::string path(raw);
    ReplaceFirst(path, kExecRootPlaceholder, exec_root);
    ReplaceFirst(path, kOutputBasePlaceholder, output_base);
    return path;
  };
}

}  // namespace pkgdriver::golang
