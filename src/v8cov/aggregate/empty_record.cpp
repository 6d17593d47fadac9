#include "empty_record.hpp"

#include "v8cov/convert/script_converter.hpp"

namespace v8cov::aggregate {

istanbul::file_coverage make_zero_coverage(const std::string& path, const convert::source_text& text) {
  istanbul::file_coverage coverage(path);
  for (const auto& line : text.lines()) {
    coverage.add_statement(line.to_location(), 0);
  }

  const istanbul::location origin{{1, 0}, {1, 0}};

  istanbul::branch_entry branch;
  branch.line = 1;
  branch.loc = origin;
  branch.locations = {origin};
  branch.counts = {0};
  coverage.add_branch(std::move(branch));

  istanbul::function_entry function;
  function.name = k_empty_function_name;
  function.decl = origin;
  function.loc = origin;
  function.line = 1;
  function.count = 0;
  coverage.add_function(std::move(function));

  return coverage;
}

result<istanbul::coverage_map> load_zero_coverage(const std::string& path, uint32_t wrapper_length) {
  convert::script_converter converter(path, wrapper_length);
  status loaded = converter.load();
  if (!loaded.ok()) {
    return error_result<istanbul::coverage_map>(loaded);
  }

  istanbul::coverage_map map;
  for (const auto& [source_path, text] : converter.reported_sources()) {
    map.merge(make_zero_coverage(source_path, *text));
  }
  return ok_result(std::move(map));
}

} // namespace v8cov::aggregate
