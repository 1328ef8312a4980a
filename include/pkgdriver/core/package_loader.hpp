#pragma once

#include <expected>
#include <filesystem>
#include <memory>
#include <vector>

#include <spdlog/spdlog.h>

#include "pkgdriver/core/package_node.hpp"
#include "pkgdriver/error/error.hpp"

namespace pkgdriver {

// PackageLoader decodes package JSON files. A file holds either one package
// object or an array of them (the standard library export uses the latter).
class PackageLoader {
 public:
  explicit PackageLoader(std::shared_ptr<spdlog::logger> logger = nullptr);

  [[nodiscard]] auto LoadFile(const std::filesystem::path& path) const
      -> std::expected<std::vector<PackageNode>, DriverError>;

  [[nodiscard]] static auto Decode(const nlohmann::json& json)
      -> std::expected<std::vector<PackageNode>, DriverError>;

 private:
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace pkgdriver
