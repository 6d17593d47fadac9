#pragma once

#include <cstdint>
#include <string>

#include <args.hxx>

namespace v8covtool::commands {

/**
 * report command - aggregates the coverage dumps of a run and writes reports
 *
 * configuration comes from V8COV_* environment variables; every flag given overrides
 * its environment value.
 *
 * @param temp_directory_flag directory holding the dumps
 * @param reports_dir_flag directory reports are written to
 * @param resolve_flag root that relative script urls resolve against
 * @param include_flag include globs (replace the configured list)
 * @param exclude_flag exclude globs (replace the configured list)
 * @param extension_flag extensions to accept (replace the configured list)
 * @param reporter_flag reporters to run (replace the configured list)
 * @param all_flag add zero records for matching files no process loaded
 * @param allow_relative_flag keep scripts whose url is not absolute
 * @param wrapper_length_flag module wrapper length subtracted from offsets
 * @return exit code (0 for success, 1 for failure)
 */
int report(
    args::ValueFlag<std::string>& temp_directory_flag, args::ValueFlag<std::string>& reports_dir_flag,
    args::ValueFlag<std::string>& resolve_flag, args::ValueFlagList<std::string>& include_flag,
    args::ValueFlagList<std::string>& exclude_flag, args::ValueFlagList<std::string>& extension_flag,
    args::ValueFlagList<std::string>& reporter_flag, args::Flag& all_flag, args::Flag& allow_relative_flag,
    args::ValueFlag<uint32_t>& wrapper_length_flag
);

} // namespace v8covtool::commands
