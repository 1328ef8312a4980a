#include "pkgdriver/core/package_node.hpp"

#include <algorithm>

namespace pkgdriver {

namespace {

template <typename T>
void GetOptional(const nlohmann::json& j, const char* key, T& value) {
  if (j.contains(key) && !j.at(key).is_null()) {
    j.at(key).get_to(value);
  }
}

}  // namespace

auto PackageNode::SourceFiles() const -> std::vector<std::string> {
  std::vector<std::string> files = go_files;
  for (const auto& file : compiled_go_files) {
    if (std::ranges::find(files, file) == files.end()) {
      files.push_back(file);
    }
  }
  return files;
}

void to_json(nlohmann::json& j, const PackageNode& node) {
  nlohmann::json imports = nlohmann::json::object();
  for (const auto& [path, target] : node.imports) {
    if (target.has_value()) {
      imports[path] = *target;
    }
  }

  j = nlohmann::json{
      {"ID", node.id},
      {"Name", node.name},
      {"PkgPath", node.pkg_path},
      {"GoFiles", node.go_files},
      {"CompiledGoFiles", node.compiled_go_files},
      {"OtherFiles", node.other_files},
      {"Imports", std::move(imports)},
      {"Standard", node.standard},
  };
  if (!node.export_file.empty()) {
    j["ExportFile"] = node.export_file;
  }
}

void from_json(const nlohmann::json& j, PackageNode& node) {
  j.at("PkgPath").get_to(node.pkg_path);
  GetOptional(j, "ID", node.id);
  GetOptional(j, "Name", node.name);
  GetOptional(j, "GoFiles", node.go_files);
  GetOptional(j, "CompiledGoFiles", node.compiled_go_files);
  GetOptional(j, "OtherFiles", node.other_files);
  GetOptional(j, "ExportFile", node.export_file);
  GetOptional(j, "Standard", node.standard);

  node.imports.clear();
  if (j.contains("Imports") && j.at("Imports").is_object()) {
    for (const auto& [path, target] : j.at("Imports").items()) {
      if (target.is_string() && !target.get<std::string>().empty()) {
        node.imports[path] = target.get<std::string>();
      } else {
        node.imports[path] = std::nullopt;
      }
    }
  }
}

}  // namespace pkgdriver
