#include "reporter.hpp"

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <system_error>

#include "v8cov/istanbul/coverage_summary.hpp"
#include "v8cov/util/file_utils.hpp"

namespace v8cov::report {

namespace {

constexpr const char* k_json_file = "coverage-final.json";

std::string summary_line(const char* label, const istanbul::coverage_metric& metric) {
  std::ostringstream line;
  line << std::left << std::setw(13) << label << ": " << format_percent(metric.percent()) << "% ( " << metric.covered
       << "/" << metric.total << " )";
  return line.str();
}

} // namespace

std::string format_percent(double value) {
  std::ostringstream formatted;
  formatted << std::fixed << std::setprecision(2) << value;
  std::string text = formatted.str();
  while (!text.empty() && text.back() == '0') {
    text.pop_back();
  }
  if (!text.empty() && text.back() == '.') {
    text.pop_back();
  }
  return text;
}

json_reporter::json_reporter() : log_(redlog::get_logger("v8cov.report.json")) {}

status json_reporter::write(const istanbul::coverage_map& map, const report_context& context) {
  std::error_code ec;
  std::filesystem::create_directories(context.reports_directory, ec);
  if (ec) {
    return make_status(
        error_code::io_error, "failed to create reports directory " + context.reports_directory + ": " + ec.message()
    );
  }

  std::filesystem::path output = std::filesystem::path(context.reports_directory) / k_json_file;
  status written = util::write_text_file(output.string(), istanbul::to_json(map).dump());
  if (!written.ok()) {
    return written;
  }

  log_.inf("wrote json report", redlog::field("path", output.string()), redlog::field("files", map.size()));
  return ok_status();
}

status text_summary_reporter::write(const istanbul::coverage_map& map, const report_context& context) {
  std::ostream& out = context.output != nullptr ? *context.output : std::cout;
  istanbul::coverage_summary summary = istanbul::summarize(map);

  out << "\n";
  out << "=============================== Coverage summary ===============================\n";
  out << summary_line("Statements", summary.statements) << "\n";
  out << summary_line("Branches", summary.branches) << "\n";
  out << summary_line("Functions", summary.functions) << "\n";
  out << summary_line("Lines", summary.lines) << "\n";
  out << "================================================================================\n";
  out.flush();

  if (!out) {
    return make_status(error_code::io_error, "failed to print coverage summary");
  }
  return ok_status();
}

result<std::unique_ptr<reporter>> make_reporter(const std::string& name) {
  if (name == "json") {
    return ok_result<std::unique_ptr<reporter>>(std::make_unique<json_reporter>());
  }
  if (name == "text-summary") {
    return ok_result<std::unique_ptr<reporter>>(std::make_unique<text_summary_reporter>());
  }
  return error_result<std::unique_ptr<reporter>>(error_code::not_found, "unknown reporter: " + name);
}

} // namespace v8cov::report
