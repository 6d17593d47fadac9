#include "dump_loader.hpp"

#include <filesystem>
#include <system_error>
#include <utility>

#include "v8cov/util/file_utils.hpp"

namespace v8cov::profile {

directory_dump_loader::directory_dump_loader(std::string directory)
    : directory_(std::move(directory)), log_(redlog::get_logger("v8cov.loader")) {}

result<std::vector<process_dump>> directory_dump_loader::load() {
  namespace fs = std::filesystem;

  std::error_code ec;
  if (!fs::is_directory(directory_, ec)) {
    return error_result<std::vector<process_dump>>(
        error_code::not_found, "coverage temp directory does not exist: " + directory_
    );
  }

  fs::directory_iterator it(directory_, ec);
  if (ec) {
    return error_result<std::vector<process_dump>>(
        error_code::io_error, "cannot list coverage temp directory " + directory_ + ": " + ec.message()
    );
  }

  std::vector<process_dump> dumps;
  size_t skipped = 0;
  status walked = util::walk_directory(std::move(it), [&](const fs::directory_iterator& entry) {
    std::error_code type_ec;
    if (!entry->is_regular_file(type_ec)) {
      return;
    }

    std::string file = entry->path().string();
    auto text = util::read_text_file(file);
    if (!text.ok()) {
      log_.wrn("skipping unreadable coverage dump", redlog::field("file", file),
               redlog::field("error", text.status.message));
      ++skipped;
      return;
    }

    auto dump = parse_process_dump(text.value, file);
    if (!dump.ok()) {
      log_.wrn("skipping invalid coverage dump", redlog::field("file", file),
               redlog::field("reason", error_code_name(dump.status.code)),
               redlog::field("error", dump.status.message));
      ++skipped;
      return;
    }

    log_.trc("loaded coverage dump", redlog::field("file", file),
             redlog::field("scripts", dump.value.coverage.result.size()));
    dumps.push_back(std::move(dump.value));
  });
  if (!walked.ok()) {
    return error_result<std::vector<process_dump>>(
        error_code::io_error, "failed while listing " + directory_ + ": " + walked.message
    );
  }

  log_.vrb("coverage dumps loaded", redlog::field("directory", directory_), redlog::field("loaded", dumps.size()),
           redlog::field("skipped", skipped));
  return ok_result(std::move(dumps));
}

std::unique_ptr<dump_loader> make_directory_dump_loader(std::string directory) {
  return std::make_unique<directory_dump_loader>(std::move(directory));
}

} // namespace v8cov::profile
