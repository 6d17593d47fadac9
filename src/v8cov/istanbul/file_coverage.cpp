#include "file_coverage.hpp"

#include <algorithm>
#include <map>
#include <utility>

namespace v8cov::istanbul {

namespace {

template <typename entry_type, typename key_fn, typename combine_fn>
std::vector<entry_type> merge_entries(
    const std::vector<entry_type>& left, const std::vector<entry_type>& right, key_fn key_of, combine_fn combine
) {
  std::map<location, entry_type> merged;
  for (const auto* side : {&left, &right}) {
    for (const auto& entry : *side) {
      auto [it, inserted] = merged.emplace(key_of(entry), entry);
      if (!inserted) {
        combine(it->second, entry);
      }
    }
  }

  std::vector<entry_type> out;
  out.reserve(merged.size());
  for (auto& [key, entry] : merged) {
    out.push_back(std::move(entry));
  }
  return out;
}

location branch_key(const branch_entry& branch) {
  return branch.locations.empty() ? branch.loc : branch.locations.front();
}

status read_position(const nlohmann::json& node, position& out) {
  if (!node.is_object()) {
    return make_status(error_code::invalid_format, "position is not an object");
  }
  auto line = node.find("line");
  if (line == node.end() || !line->is_number()) {
    return make_status(error_code::invalid_format, "position needs a numeric line");
  }
  out.line = line->get<uint32_t>();
  // some instrumenters leave the end column null
  auto column = node.find("column");
  out.column = (column != node.end() && column->is_number()) ? column->get<uint32_t>() : 0u;
  return ok_status();
}

status read_location(const nlohmann::json& node, location& out) {
  if (!node.is_object() || !node.contains("start") || !node.contains("end")) {
    return make_status(error_code::invalid_format, "location needs start and end");
  }
  status st = read_position(node.at("start"), out.start);
  if (!st.ok()) {
    return st;
  }
  return read_position(node.at("end"), out.end);
}

const nlohmann::json* find_object(const nlohmann::json& node, const char* key) {
  auto it = node.find(key);
  if (it == node.end() || !it->is_object()) {
    return nullptr;
  }
  return &*it;
}

// istanbul keys are decimal indices; iterate them numerically rather than as strings
std::vector<std::string> ordered_keys(const nlohmann::json& node) {
  std::vector<std::string> keys;
  for (const auto& item : node.items()) {
    keys.push_back(item.key());
  }
  std::stable_sort(keys.begin(), keys.end(), [](const std::string& left, const std::string& right) {
    if (left.size() != right.size()) {
      return left.size() < right.size();
    }
    return left < right;
  });
  return keys;
}

int64_t read_count(const nlohmann::json& node) {
  if (node.is_boolean()) {
    return node.get<bool>() ? 1 : 0;
  }
  if (node.is_number()) {
    return node.get<int64_t>();
  }
  return 0;
}

} // namespace

file_coverage::file_coverage(std::string path) : path_(std::move(path)) {}

void file_coverage::add_statement(const location& loc, int64_t count) {
  statements_.push_back(statement_entry{loc, count});
}

void file_coverage::add_function(function_entry function) { functions_.push_back(std::move(function)); }

void file_coverage::add_branch(branch_entry branch) {
  if (branch.counts.size() < branch.locations.size()) {
    branch.counts.resize(branch.locations.size(), 0);
  }
  branches_.push_back(std::move(branch));
}

void file_coverage::merge(const file_coverage& other) {
  statements_ = merge_entries(
      statements_, other.statements_, [](const statement_entry& entry) { return entry.loc; },
      [](statement_entry& into, const statement_entry& from) { into.count += from.count; }
  );

  functions_ = merge_entries(
      functions_, other.functions_, [](const function_entry& entry) { return entry.loc; },
      [](function_entry& into, const function_entry& from) {
        into.count += from.count;
        if (into.name.empty()) {
          into.name = from.name;
        }
      }
  );

  branches_ = merge_entries(branches_, other.branches_, branch_key, [](branch_entry& into, const branch_entry& from) {
    if (into.counts.size() < from.counts.size()) {
      into.counts.resize(from.counts.size(), 0);
    }
    for (size_t i = 0; i < from.counts.size(); ++i) {
      into.counts[i] += from.counts[i];
    }
  });
}

nlohmann::json to_json(const location& loc) {
  return nlohmann::json{
      {"start", {{"line", loc.start.line}, {"column", loc.start.column}}},
      {"end", {{"line", loc.end.line}, {"column", loc.end.column}}},
  };
}

nlohmann::json to_json(const file_coverage& coverage) {
  nlohmann::json statement_map = nlohmann::json::object();
  nlohmann::json s = nlohmann::json::object();
  for (size_t i = 0; i < coverage.statements().size(); ++i) {
    const auto& statement = coverage.statements()[i];
    statement_map[std::to_string(i)] = to_json(statement.loc);
    s[std::to_string(i)] = statement.count;
  }

  nlohmann::json fn_map = nlohmann::json::object();
  nlohmann::json f = nlohmann::json::object();
  for (size_t i = 0; i < coverage.functions().size(); ++i) {
    const auto& function = coverage.functions()[i];
    fn_map[std::to_string(i)] = {
        {"name", function.name}, {"decl", to_json(function.decl)}, {"loc", to_json(function.loc)},
        {"line", function.line}
    };
    f[std::to_string(i)] = function.count;
  }

  nlohmann::json branch_map = nlohmann::json::object();
  nlohmann::json b = nlohmann::json::object();
  for (size_t i = 0; i < coverage.branches().size(); ++i) {
    const auto& branch = coverage.branches()[i];
    nlohmann::json locations = nlohmann::json::array();
    for (const auto& loc : branch.locations) {
      locations.push_back(to_json(loc));
    }
    branch_map[std::to_string(i)] = {
        {"type", branch.type}, {"line", branch.line}, {"loc", to_json(branch.loc)}, {"locations", std::move(locations)}
    };
    b[std::to_string(i)] = branch.counts;
  }

  return nlohmann::json{
      {"path", coverage.path()},   {"statementMap", std::move(statement_map)}, {"s", std::move(s)},
      {"fnMap", std::move(fn_map)}, {"f", std::move(f)},                        {"branchMap", std::move(branch_map)},
      {"b", std::move(b)},
  };
}

result<file_coverage> file_coverage_from_json(const nlohmann::json& node) {
  if (!node.is_object()) {
    return error_result<file_coverage>(error_code::invalid_format, "file coverage is not an object");
  }
  auto path = node.find("path");
  if (path == node.end() || !path->is_string()) {
    return error_result<file_coverage>(error_code::invalid_format, "file coverage has no path");
  }
  file_coverage coverage(path->get<std::string>());

  const nlohmann::json* statement_map = find_object(node, "statementMap");
  const nlohmann::json* s = find_object(node, "s");
  if (statement_map != nullptr && s != nullptr) {
    for (const auto& key : ordered_keys(*statement_map)) {
      location loc;
      status st = read_location(statement_map->at(key), loc);
      if (!st.ok()) {
        return error_result<file_coverage>(std::move(st));
      }
      auto count = s->find(key);
      coverage.add_statement(loc, count == s->end() ? 0 : read_count(*count));
    }
  }

  const nlohmann::json* fn_map = find_object(node, "fnMap");
  const nlohmann::json* f = find_object(node, "f");
  if (fn_map != nullptr && f != nullptr) {
    for (const auto& key : ordered_keys(*fn_map)) {
      const nlohmann::json& value = fn_map->at(key);
      function_entry function;
      if (value.contains("name") && value.at("name").is_string()) {
        function.name = value.at("name").get<std::string>();
      }
      status st = read_location(value.value("loc", nlohmann::json()), function.loc);
      if (!st.ok()) {
        return error_result<file_coverage>(std::move(st));
      }
      function.decl = function.loc;
      if (value.contains("decl")) {
        st = read_location(value.at("decl"), function.decl);
        if (!st.ok()) {
          return error_result<file_coverage>(std::move(st));
        }
      }
      function.line = value.value("line", function.loc.start.line);
      auto count = f->find(key);
      function.count = count == f->end() ? 0 : read_count(*count);
      coverage.add_function(std::move(function));
    }
  }

  const nlohmann::json* branch_map = find_object(node, "branchMap");
  const nlohmann::json* b = find_object(node, "b");
  if (branch_map != nullptr && b != nullptr) {
    for (const auto& key : ordered_keys(*branch_map)) {
      const nlohmann::json& value = branch_map->at(key);
      branch_entry branch;
      branch.type = value.value("type", std::string("branch"));
      status st = read_location(value.value("loc", nlohmann::json()), branch.loc);
      if (!st.ok()) {
        return error_result<file_coverage>(std::move(st));
      }
      branch.line = value.value("line", branch.loc.start.line);
      if (value.contains("locations") && value.at("locations").is_array()) {
        for (const auto& loc_node : value.at("locations")) {
          location loc;
          st = read_location(loc_node, loc);
          if (!st.ok()) {
            return error_result<file_coverage>(std::move(st));
          }
          branch.locations.push_back(loc);
        }
      }
      auto counts = b->find(key);
      if (counts != b->end() && counts->is_array()) {
        for (const auto& count : *counts) {
          branch.counts.push_back(read_count(count));
        }
      }
      coverage.add_branch(std::move(branch));
    }
  }

  return ok_result(std::move(coverage));
}

} // namespace v8cov::istanbul
