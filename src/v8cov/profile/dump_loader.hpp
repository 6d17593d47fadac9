#pragma once

#include <memory>
#include <string>
#include <vector>

#include <redlog.hpp>

#include "process_coverage.hpp"
#include "v8cov/core/result.hpp"

namespace v8cov::profile {

// source of per-process dumps for one aggregation run
class dump_loader {
public:
  virtual ~dump_loader() = default;

  // fails only when no dumps can be listed at all; bad individual dumps are skipped
  virtual result<std::vector<process_dump>> load() = 0;
};

/**
 * loads every regular file of a directory as a process dump, in listing order.
 * unreadable or invalid files are logged and skipped; a missing directory is an error.
 */
class directory_dump_loader final : public dump_loader {
public:
  explicit directory_dump_loader(std::string directory);

  result<std::vector<process_dump>> load() override;

  const std::string& directory() const { return directory_; }

private:
  std::string directory_;
  redlog::logger log_;
};

std::unique_ptr<dump_loader> make_directory_dump_loader(std::string directory);

} // namespace v8cov::profile
