#include "process_normalizer.hpp"

#include "v8cov/path/file_url.hpp"

namespace v8cov::profile {

process_coverage normalize_process_coverage(
    process_coverage coverage, const filter::inclusion_filter& filter, const normalize_options& options,
    const redlog::logger& log
) {
  process_coverage normalized;
  normalized.result.reserve(coverage.result.size());

  for (auto& script : coverage.result) {
    if (path::is_file_url(script.url)) {
      auto converted = path::file_url_to_path(script.url);
      if (!converted.ok()) {
        log.wrn(
            "skipping script with invalid file url", redlog::field("url", script.url),
            redlog::field("error", converted.status.message)
        );
        continue;
      }
      script.url = std::move(converted.value);
    }

    if (!filter.should_instrument(script.url)) {
      log.ped("script excluded by filter", redlog::field("url", script.url));
      continue;
    }
    if (options.omit_relative && !path::is_absolute(script.url)) {
      log.ped("relative script omitted", redlog::field("url", script.url));
      continue;
    }
    normalized.result.push_back(std::move(script));
  }

  return normalized;
}

} // namespace v8cov::profile
