#include "report.hpp"

#include <memory>
#include <vector>

#include <redlog.hpp>

#include "v8cov/aggregate/coverage_aggregator.hpp"
#include "v8cov/aggregate/report_config.hpp"
#include "v8cov/profile/dump_loader.hpp"
#include "v8cov/report/reporter.hpp"

namespace v8covtool::commands {

int report(
    args::ValueFlag<std::string>& temp_directory_flag, args::ValueFlag<std::string>& reports_dir_flag,
    args::ValueFlag<std::string>& resolve_flag, args::ValueFlagList<std::string>& include_flag,
    args::ValueFlagList<std::string>& exclude_flag, args::ValueFlagList<std::string>& extension_flag,
    args::ValueFlagList<std::string>& reporter_flag, args::Flag& all_flag, args::Flag& allow_relative_flag,
    args::ValueFlag<uint32_t>& wrapper_length_flag
) {
  auto log = redlog::get_logger("v8covtool.report");

  v8cov::aggregate::report_config config;
  config.load_from_environment();

  if (temp_directory_flag) {
    config.temp_directory = args::get(temp_directory_flag);
  }
  if (reports_dir_flag) {
    config.reports_directory = args::get(reports_dir_flag);
  }
  if (resolve_flag) {
    config.resolve_root = args::get(resolve_flag);
  }
  if (include_flag) {
    config.include = args::get(include_flag);
  }
  if (exclude_flag) {
    config.exclude = args::get(exclude_flag);
  }
  if (extension_flag) {
    config.extensions = args::get(extension_flag);
  }
  if (reporter_flag) {
    config.reporters = args::get(reporter_flag);
  }
  if (all_flag) {
    config.all = true;
  }
  if (allow_relative_flag) {
    config.omit_relative = false;
  }
  if (wrapper_length_flag) {
    config.wrapper_length = args::get(wrapper_length_flag);
  }

  std::string error;
  if (!config.validate(error)) {
    log.err("invalid configuration", redlog::field("error", error));
    return 1;
  }
  config.log_config(log);

  // reporters are resolved before the expensive aggregation
  std::vector<std::unique_ptr<v8cov::report::reporter>> reporters;
  for (const auto& name : config.reporters) {
    auto created = v8cov::report::make_reporter(name);
    if (!created.ok()) {
      log.err("cannot create reporter", redlog::field("name", name), redlog::field("error", created.status.message));
      return 1;
    }
    reporters.push_back(std::move(created.value));
  }

  auto filter = v8cov::aggregate::make_config_filter(config);
  std::shared_ptr<v8cov::profile::dump_loader> loader = v8cov::profile::make_directory_dump_loader(config.temp_directory);
  v8cov::aggregate::coverage_aggregator aggregator(config, filter, loader);

  auto map = aggregator.coverage_map();
  if (!map.ok()) {
    log.err(
        "failed to aggregate coverage", redlog::field("code", v8cov::error_code_name(map.status.code)),
        redlog::field("error", map.status.message)
    );
    return 1;
  }

  v8cov::report::report_context context;
  context.reports_directory = config.reports_directory;
  context.watermarks = config.watermarks;

  int exit_code = 0;
  for (auto& reporter : reporters) {
    auto written = reporter->write(*map.value, context);
    if (!written.ok()) {
      log.err("reporter failed", redlog::field("reporter", reporter->name()), redlog::field("error", written.message));
      exit_code = 1;
    } else {
      log.vrb("reporter finished", redlog::field("reporter", reporter->name()));
    }
  }

  return exit_code;
}

} // namespace v8covtool::commands
