#pragma once

#include <memory>
#include <ostream>
#include <string>

#include <redlog.hpp>

#include "v8cov/aggregate/report_config.hpp"
#include "v8cov/core/result.hpp"
#include "v8cov/istanbul/coverage_map.hpp"

namespace v8cov::report {

struct report_context {
  std::string reports_directory;
  aggregate::watermarks watermarks;
  // console reporters print here; null means stdout
  std::ostream* output = nullptr;
};

class reporter {
public:
  virtual ~reporter() = default;

  virtual const char* name() const = 0;
  virtual status write(const istanbul::coverage_map& map, const report_context& context) = 0;
};

// writes <reports_directory>/coverage-final.json
class json_reporter final : public reporter {
public:
  json_reporter();

  const char* name() const override { return "json"; }
  status write(const istanbul::coverage_map& map, const report_context& context) override;

private:
  redlog::logger log_;
};

// prints statement, branch, function and line totals
class text_summary_reporter final : public reporter {
public:
  const char* name() const override { return "text-summary"; }
  status write(const istanbul::coverage_map& map, const report_context& context) override;
};

result<std::unique_ptr<reporter>> make_reporter(const std::string& name);

// percentages the way istanbul prints them: at most two decimals, no trailing zeros
std::string format_percent(double value);

} // namespace v8cov::report
