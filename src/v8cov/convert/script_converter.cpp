#include "script_converter.hpp"

#include <algorithm>

#include "v8cov/util/file_utils.hpp"

namespace v8cov::convert {

script_converter::script_converter(std::string path, uint32_t wrapper_length, converter_sources sources)
    : path_(std::move(path)), wrapper_length_(wrapper_length), sources_(std::move(sources)),
      log_(redlog::get_logger("v8cov.convert")) {}

status script_converter::load() {
  std::string raw;
  if (sources_.source) {
    raw = *sources_.source;
  } else {
    auto contents = util::read_text_file(path_);
    if (!contents.ok()) {
      return contents.status;
    }
    raw = std::move(contents.value);
  }
  generated_ = source_text(raw);
  files_.clear();
  map_.reset();

  if (sources_.source_map && !sources_.source_map->is_null()) {
    status loaded = load_source_map(*sources_.source_map);
    if (!loaded.ok()) {
      return loaded;
    }
  } else if (auto url = find_source_mapping_url(generated_.raw())) {
    auto referenced = load_referenced_source_map(path_, *url);
    if (referenced.ok()) {
      status loaded = load_source_map(referenced.value);
      if (!loaded.ok()) {
        return loaded;
      }
    } else {
      log_.dbg(
          "ignoring unreadable source map reference", redlog::field("path", path_), redlog::field("url", *url),
          redlog::field("error", referenced.status.message)
      );
    }
  }

  if (!map_) {
    covered_file file;
    file.path = path_;
    file.text = generated_;
    files_.push_back(std::move(file));
  }

  log_.trc(
      "loaded script", redlog::field("path", path_), redlog::field("lines", generated_.lines().size()),
      redlog::field("sources", files_.size())
  );
  return ok_status();
}

status script_converter::load_source_map(const nlohmann::json& data) {
  auto parsed = source_map::parse(data);
  if (!parsed.ok()) {
    return make_status(parsed.status.code, "source map for " + path_ + ": " + parsed.status.message);
  }

  std::vector<covered_file> files;
  for (size_t i = 0; i < parsed.value.sources().size(); ++i) {
    covered_file file;
    file.path = resolve_source_path(path_, parsed.value.source_root(), parsed.value.sources()[i]);

    if (auto content = parsed.value.source_content(i)) {
      file.text = source_text(*content);
    } else {
      auto contents = util::read_text_file(file.path);
      if (!contents.ok()) {
        return make_status(contents.status.code, "original source of " + path_ + ": " + contents.status.message);
      }
      file.text = source_text(contents.value);
    }
    files.push_back(std::move(file));
  }

  if (files.empty()) {
    log_.dbg("source map names no sources, using generated code", redlog::field("path", path_));
    return ok_status();
  }

  map_ = std::move(parsed.value);
  files_ = std::move(files);
  return ok_status();
}

std::vector<std::pair<std::string, const source_text*>> script_converter::reported_sources() const {
  std::vector<std::pair<std::string, const source_text*>> sources;
  sources.reserve(files_.size());
  for (const auto& file : files_) {
    sources.emplace_back(file.path, &file.text);
  }
  return sources;
}

std::optional<original_position> script_converter::lookup(uint32_t line, uint32_t column) const {
  auto position = map_->original_position_for(line, column, lookup_bias::greatest_lower_bound);
  if (!position) {
    position = map_->original_position_for(line, column, lookup_bias::least_upper_bound);
  }
  return position;
}

std::optional<script_converter::mapped_range> script_converter::map_range(int64_t start, int64_t end) const {
  auto [first, last] = generated_.overlapping(start, end);
  if (first == last) {
    return std::nullopt;
  }
  const source_line& first_line = generated_.lines()[first];
  const source_line& last_line = generated_.lines()[last - 1];

  auto start_column = static_cast<uint32_t>(std::max<int64_t>(0, start - first_line.start_col));
  auto end_column = static_cast<uint32_t>(std::max<int64_t>(0, end - last_line.start_col));

  auto original_start = lookup(first_line.line, start_column);
  auto original_end = lookup(last_line.line, end_column > 0 ? end_column - 1 : 0);
  if (!original_start || !original_end || original_start->source != original_end->source) {
    return std::nullopt;
  }

  const covered_file& file = files_[original_start->source];
  mapped_range mapped;
  mapped.file = original_start->source;
  mapped.start = file.text.offset_of(original_start->line, original_start->column);
  mapped.end = file.text.offset_of(original_end->line, static_cast<int64_t>(original_end->column) + 1);
  if (mapped.end < mapped.start) {
    return std::nullopt;
  }
  return mapped;
}

void script_converter::apply_coverage(const std::vector<profile::function_coverage>& functions) {
  for (const auto& function : functions) {
    for (size_t index = 0; index < function.ranges.size(); ++index) {
      const auto& range = function.ranges[index];

      covered_file* file = nullptr;
      int64_t start = 0;
      int64_t end = 0;
      if (map_) {
        int64_t generated_start = std::max<int64_t>(0, range.start_offset - wrapper_length_);
        int64_t generated_end = std::min<int64_t>(generated_.eof(), range.end_offset - wrapper_length_);
        auto mapped = map_range(generated_start, generated_end);
        if (!mapped) {
          log_.ped(
              "dropping unmapped range", redlog::field("path", path_), redlog::field("start", range.start_offset),
              redlog::field("end", range.end_offset)
          );
          continue;
        }
        file = &files_[mapped->file];
        start = mapped->start;
        end = mapped->end;
      } else {
        file = &files_.front();
        start = std::max<int64_t>(0, range.start_offset - wrapper_length_);
        end = std::min<int64_t>(file->text.eof(), range.end_offset - wrapper_length_);
      }

      record_range(*file, start, end, range, function, index);
    }
  }
}

void script_converter::record_range(
    covered_file& file, int64_t start, int64_t end, const profile::coverage_range& range,
    const profile::function_coverage& function, size_t index
) {
  auto [first, last] = file.text.overlapping(start, end);
  if (first == last) {
    return;
  }

  auto& lines = file.text.lines();
  const source_line& first_line = lines[first];
  const source_line& last_line = lines[last - 1];

  covered_span span;
  span.start_line = first_line.line;
  span.start_column = static_cast<uint32_t>(std::max<int64_t>(0, start - first_line.start_col));
  span.end_line = last_line.line;
  span.end_column = static_cast<uint32_t>(std::max<int64_t>(0, end - last_line.start_col));
  span.count = range.count;

  if (function.is_block_coverage) {
    file.branches.push_back(span);
  }
  if (!function.function_name.empty() && (index == 0 || !function.is_block_coverage)) {
    file.functions.push_back(covered_function{function.function_name, span});
  }

  for (size_t i = first; i < last; ++i) {
    source_line& line = lines[i];
    if (start <= line.start_col && end >= line.end_col && !line.ignore) {
      line.count = range.count;
    }
  }
}

istanbul::coverage_map script_converter::to_istanbul() const {
  istanbul::coverage_map map;
  for (const auto& file : files_) {
    istanbul::file_coverage coverage(file.path);

    for (const auto& line : file.text.lines()) {
      coverage.add_statement(line.to_location(), line.count);
    }

    auto ignored = [&file](uint32_t line) {
      const source_line* entry = file.text.line_at(line);
      return entry != nullptr && entry->ignore;
    };

    for (const auto& branch : file.branches) {
      istanbul::branch_entry entry;
      entry.line = branch.start_line;
      entry.loc = branch.to_location();
      entry.locations = {entry.loc};
      entry.counts = {ignored(branch.start_line) ? 1 : branch.count};
      coverage.add_branch(std::move(entry));
    }

    for (const auto& function : file.functions) {
      istanbul::function_entry entry;
      entry.name = function.name;
      entry.decl = function.span.to_location();
      entry.loc = entry.decl;
      entry.line = function.span.start_line;
      entry.count = ignored(function.span.start_line) ? 1 : function.span.count;
      coverage.add_function(std::move(entry));
    }

    map.merge(coverage);
  }
  return map;
}

} // namespace v8cov::convert
