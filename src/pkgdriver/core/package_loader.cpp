#include "pkgdriver/core/package_loader.hpp"

#include <fstream>

#include <fmt/format.h>

namespace pkgdriver {

PackageLoader::PackageLoader(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? logger : spdlog::default_logger()) {
}

auto PackageLoader::LoadFile(const std::filesystem::path& path) const
    -> std::expected<std::vector<PackageNode>, DriverError> {
  std::ifstream file(path);
  if (!file) {
    logger_->error("PackageLoader failed to open: {}", path.string());
    return DriverError::Unexpected(
        DriverErrorCode::FileNotFound, path.string());
  }

  nlohmann::json json;
  try {
    json = nlohmann::json::parse(file);
  } catch (const nlohmann::json::parse_error& e) {
    logger_->error(
        "PackageLoader failed to parse {}: {}", path.string(), e.what());
    return DriverError::Unexpected(
        DriverErrorCode::InvalidPackage,
        fmt::format("{}: {}", path.string(), e.what()));
  }

  auto nodes = Decode(json);
  if (!nodes) {
    logger_->error(
        "PackageLoader rejected {}: {}", path.string(), nodes.error().message());
    return nodes;
  }

  logger_->trace(
      "PackageLoader loaded {} packages from {}", nodes->size(), path.string());
  return nodes;
}

auto PackageLoader::Decode(const nlohmann::json& json)
    -> std::expected<std::vector<PackageNode>, DriverError> {
  std::vector<PackageNode> nodes;

  auto decode_one = [&nodes](const nlohmann::json& object)
      -> std::expected<void, DriverError> {
    if (!object.is_object()) {
      return DriverError::Unexpected(
          DriverErrorCode::InvalidPackage, "package record is not an object");
    }
    try {
      nodes.push_back(object.get<PackageNode>());
    } catch (const nlohmann::json::exception& e) {
      return DriverError::Unexpected(
          DriverErrorCode::InvalidPackage, e.what());
    }
    return {};
  };

  if (json.is_array()) {
    for (const auto& object : json) {
      if (auto decoded = decode_one(object); !decoded) {
        return std::unexpected(decoded.error());
      }
    }
  } else if (auto decoded = decode_one(json); !decoded) {
    return std::unexpected(decoded.error());
  }

  return nodes;
}

}  // namespace pkgdriver
