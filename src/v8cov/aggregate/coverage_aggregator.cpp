#include "coverage_aggregator.hpp"

#include <exception>

#include "empty_record.hpp"
#include "v8cov/convert/script_converter.hpp"
#include "v8cov/path/file_url.hpp"
#include "v8cov/profile/cjs_esm_bridge.hpp"
#include "v8cov/profile/merge.hpp"
#include "v8cov/profile/process_normalizer.hpp"

namespace v8cov::aggregate {

namespace {

struct deferred_bridge {
  std::unique_ptr<convert::script_converter> converter;
  const profile::script_coverage* script = nullptr;
};

void apply_and_merge(
    convert::script_converter& converter, const profile::script_coverage& script, istanbul::coverage_map& map,
    const redlog::logger& log
) {
  try {
    converter.apply_coverage(script.functions);
    map.merge(converter.to_istanbul());
  } catch (const std::exception& e) {
    log.wrn("failed to convert script", redlog::field("url", script.url), redlog::field("error", e.what()));
  }
}

} // namespace

istanbul::coverage_map convert_scripts(
    const std::vector<profile::script_coverage>& scripts, const conversion_options& options,
    const source_map_registry& source_maps, seen_files* seen, const redlog::logger& log
) {
  istanbul::coverage_map map;
  std::map<std::string, size_t> applied_per_path;
  std::vector<deferred_bridge> bridges;

  for (const auto& script : scripts) {
    std::string script_path = path::resolve_path(options.resolve_root, script.url);

    // a file counts as loaded as soon as a script maps to it, even if conversion fails
    if (seen != nullptr) {
      auto it = seen->find(script_path);
      if (it != seen->end()) {
        it->second = true;
      }
    }

    auto converter = std::make_unique<convert::script_converter>(
        script_path, options.wrapper_length, source_maps.sources_for(script_path)
    );

    status loaded;
    try {
      loaded = converter->load();
    } catch (const std::exception& e) {
      loaded = make_status(error_code::internal_error, e.what());
    }
    if (!loaded.ok()) {
      log.wrn(
          "skipping script", redlog::field("url", script.url), redlog::field("code", error_code_name(loaded.code)),
          redlog::field("error", loaded.message)
      );
      continue;
    }

    if (profile::is_cjs_esm_bridge(script)) {
      log.trc("deferring cjs/esm bridge", redlog::field("path", script_path));
      bridges.push_back(deferred_bridge{std::move(converter), &script});
      continue;
    }

    ++applied_per_path[script_path];
    apply_and_merge(*converter, script, map, log);
  }

  for (auto& bridge : bridges) {
    const std::string& bridge_path = bridge.converter->path();
    if (applied_per_path.count(bridge_path) != 0) {
      log.dbg("dropping cjs/esm bridge duplicate", redlog::field("path", bridge_path));
      continue;
    }
    apply_and_merge(*bridge.converter, *bridge.script, map, log);
  }

  return map;
}

void fill_unseen_files(
    const seen_files& seen, const conversion_options& options, istanbul::coverage_map& map, const redlog::logger& log
) {
  size_t filled = 0;
  for (const auto& [file_path, was_seen] : seen) {
    if (was_seen) {
      continue;
    }
    result<istanbul::coverage_map> zero;
    try {
      zero = load_zero_coverage(file_path, options.wrapper_length);
    } catch (const std::exception& e) {
      zero = error_result<istanbul::coverage_map>(error_code::internal_error, e.what());
    }
    if (!zero.ok()) {
      log.wrn("cannot build empty record", redlog::field("path", file_path), redlog::field("error", zero.status.message));
      continue;
    }
    map.merge(zero.value);
    ++filled;
  }
  log.dbg("filled unloaded files", redlog::field("count", filled));
}

coverage_aggregator::coverage_aggregator(
    report_config config, std::shared_ptr<const filter::inclusion_filter> filter,
    std::shared_ptr<profile::dump_loader> loader
)
    : config_(std::move(config)), filter_(std::move(filter)), loader_(std::move(loader)),
      log_(redlog::get_logger("v8cov.aggregate")) {}

result<std::shared_ptr<const istanbul::coverage_map>> coverage_aggregator::coverage_map() {
  if (cached_) {
    log_.trc("returning memoized coverage map");
    return ok_result(cached_);
  }

  auto built = build();
  if (built.ok()) {
    cached_ = built.value;
  }
  return built;
}

result<std::shared_ptr<const istanbul::coverage_map>> coverage_aggregator::build() {
  using map_result = result<std::shared_ptr<const istanbul::coverage_map>>;

  if (!filter_ || !loader_) {
    return map_result{nullptr, make_status(error_code::invalid_argument, "aggregator needs a filter and a loader")};
  }

  auto dumps = loader_->load();
  if (!dumps.ok()) {
    return map_result{nullptr, dumps.status};
  }

  const std::string resolve_root = path::resolve_path(config_.effective_resolve_root(), ".");

  source_map_registry source_maps;
  std::vector<profile::process_coverage> normalized;
  normalized.reserve(dumps.value.size());

  profile::normalize_options normalize;
  normalize.omit_relative = config_.omit_relative;

  for (auto& dump : dumps.value) {
    source_maps.absorb(dump.source_maps);
    normalized.push_back(profile::normalize_process_coverage(std::move(dump.coverage), *filter_, normalize, log_));
  }

  profile::process_coverage merged = profile::merge_process_coverages(normalized);
  log_.dbg(
      "merged process coverage", redlog::field("dumps", normalized.size()),
      redlog::field("scripts", merged.result.size()), redlog::field("source_maps", source_maps.size())
  );

  seen_files seen;
  if (config_.all) {
    for (const auto& file : filter_->glob(resolve_root)) {
      seen.emplace(path::resolve_path(resolve_root, file), false);
    }
    log_.dbg("collected files for all-files mode", redlog::field("count", seen.size()));
  }

  conversion_options options;
  options.resolve_root = resolve_root;
  options.wrapper_length = config_.wrapper_length;

  auto map = std::make_shared<istanbul::coverage_map>(
      convert_scripts(merged.result, options, source_maps, config_.all ? &seen : nullptr, log_)
  );

  if (config_.all) {
    fill_unseen_files(seen, options, *map, log_);
  }

  log_.inf("coverage map ready", redlog::field("files", map->size()));
  return map_result{std::move(map), ok_status()};
}

std::shared_ptr<const filter::inclusion_filter> make_config_filter(const report_config& config) {
  filter::inclusion_rules rules;
  rules.cwd = config.effective_resolve_root();
  rules.include = config.include;
  rules.exclude = config.exclude;
  rules.extensions = config.extensions;
  rules.exclude_node_modules = config.exclude_node_modules;
  return filter::make_inclusion_filter(std::move(rules));
}

} // namespace v8cov::aggregate
