#include "source_map_registry.hpp"

#include "v8cov/path/file_url.hpp"

namespace v8cov::aggregate {

source_map_registry::source_map_registry() : log_(redlog::get_logger("v8cov.source_maps")) {}

void source_map_registry::absorb(const profile::source_map_cache& cache) {
  for (const auto& [key, entry] : cache) {
    std::string path = key;
    if (path::is_file_url(key)) {
      auto converted = path::file_url_to_path(key);
      if (!converted.ok()) {
        log_.wrn("skipping source map with bad url", redlog::field("url", key), redlog::field("error", converted.status.message));
        continue;
      }
      path = std::move(converted.value);
    }
    entries_[path] = entry;
  }
}

const profile::source_map_entry* source_map_registry::find(const std::string& path) const {
  auto it = entries_.find(path);
  return it == entries_.end() ? nullptr : &it->second;
}

convert::converter_sources source_map_registry::sources_for(const std::string& path) const {
  convert::converter_sources sources;
  const profile::source_map_entry* entry = find(path);
  if (entry == nullptr) {
    return sources;
  }

  sources.source_map = entry->data;
  if (entry->line_lengths) {
    sources.source = convert::make_placeholder_source(*entry->line_lengths);
  }
  return sources;
}

} // namespace v8cov::aggregate
