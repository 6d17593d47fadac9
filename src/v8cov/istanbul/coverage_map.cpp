#include "coverage_map.hpp"

namespace v8cov::istanbul {

void coverage_map::merge(const file_coverage& file) {
  // merging into an empty record also folds entries sharing a location
  auto [it, inserted] = files_.try_emplace(file.path(), file.path());
  it->second.merge(file);
}

void coverage_map::merge(const coverage_map& other) {
  for (const auto& [path, file] : other.files_) {
    merge(file);
  }
}

const file_coverage* coverage_map::find(const std::string& path) const {
  auto it = files_.find(path);
  return it == files_.end() ? nullptr : &it->second;
}

nlohmann::json to_json(const coverage_map& map) {
  nlohmann::json document = nlohmann::json::object();
  for (const auto& [path, file] : map.files()) {
    document[path] = to_json(file);
  }
  return document;
}

result<coverage_map> coverage_map_from_json(const nlohmann::json& document) {
  if (!document.is_object()) {
    return error_result<coverage_map>(error_code::invalid_format, "coverage map is not an object");
  }

  coverage_map map;
  for (const auto& item : document.items()) {
    nlohmann::json node = item.value();
    // older writers wrap the record in a "data" member
    if (node.is_object() && node.contains("data") && node.at("data").is_object()) {
      node = node.at("data");
    }
    if (node.is_object() && !node.contains("path")) {
      node["path"] = item.key();
    }
    auto file = file_coverage_from_json(node);
    if (!file.ok()) {
      return error_result<coverage_map>(
          file.status.code, "invalid coverage for " + item.key() + ": " + file.status.message
      );
    }
    map.merge(file.value);
  }
  return ok_result(std::move(map));
}

} // namespace v8cov::istanbul
