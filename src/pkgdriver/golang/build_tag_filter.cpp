#include "pkgdriver/golang/build_tag_filter.hpp"

#include <algorithm>
#include <filesystem>
#include <unordered_set>
#include <vector>

namespace pkgdriver::golang {

namespace {

const std::unordered_set<std::string_view> kKnownOs = {
    "aix",     "android", "darwin",  "dragonfly", "freebsd", "hurd",
    "illumos", "ios",     "js",      "linux",     "nacl",    "netbsd",
    "openbsd", "plan9",   "solaris", "wasip1",    "windows", "zos",
};

const std::unordered_set<std::string_view> kKnownArch = {
    "386",         "amd64",   "amd64p32", "arm",      "armbe",  "arm64",
    "arm64be",     "loong64", "mips",     "mipsle",   "mips64", "mips64le",
    "mips64p32",   "mips64p32le",         "ppc",      "ppc64",  "ppc64le",
    "riscv",       "riscv64", "s390",     "s390x",    "sparc",  "sparc64",
    "wasm",
};

auto Split(std::string_view text, char separator)
    -> std::vector<std::string_view> {
  std::vector<std::string_view> parts;
  size_t start = 0;
  while (true) {
    auto pos = text.find(separator, start);
    if (pos == std::string_view::npos) {
      parts.push_back(text.substr(start));
      return parts;
    }
    parts.push_back(text.substr(start, pos - start));
    start = pos + 1;
  }
}

}  // namespace

GoosGoarchFilter::GoosGoarchFilter(
    std::string goos, std::string goarch,
    std::shared_ptr<spdlog::logger> logger)
    : goos_(std::move(goos)),
      goarch_(std::move(goarch)),
      logger_(logger ? logger : spdlog::default_logger()) {
}

void GoosGoarchFilter::FilterFiles(PackageNode& node) const {
  auto filter = [this, &node](std::vector<std::string>& files) {
    auto removed = std::ranges::remove_if(files, [this](const auto& file) {
      return !MatchFile(std::filesystem::path(file).filename().string());
    });
    if (!removed.empty()) {
      logger_->debug(
          "GoosGoarchFilter: dropped {} files of {} for {}/{}", removed.size(),
          node.id, goos_, goarch_);
    }
    files.erase(removed.begin(), removed.end());
  };

  filter(node.go_files);
  filter(node.compiled_go_files);
}

auto GoosGoarchFilter::MatchFile(std::string_view file_name) const -> bool {
  auto name = file_name.substr(0, file_name.find('.'));

  // Everything before the first underscore is the free-form part of the name
  auto underscore = name.find('_');
  if (underscore == std::string_view::npos) {
    return true;
  }
  auto parts = Split(name.substr(underscore + 1), '_');
  if (!parts.empty() && parts.back() == "test") {
    parts.pop_back();
  }

  const auto n = parts.size();
  if (n >= 2 && kKnownOs.contains(parts[n - 2]) &&
      kKnownArch.contains(parts[n - 1])) {
    return MatchTag(parts[n - 2]) && MatchTag(parts[n - 1]);
  }
  if (n >= 1 &&
      (kKnownOs.contains(parts[n - 1]) || kKnownArch.contains(parts[n - 1]))) {
    return MatchTag(parts[n - 1]);
  }
  return true;
}

auto GoosGoarchFilter::MatchTag(std::string_view tag) const -> bool {
  if (tag == goos_ || tag == goarch_) {
    return true;
  }
  // Platforms that also satisfy the constraints of their parent platform
  return (goos_ == "android" && tag == "linux") ||
         (goos_ == "illumos" && tag == "solaris") ||
         (goos_ == "ios" && tag == "darwin");
}

}  // namespace pkgdriver::golang
