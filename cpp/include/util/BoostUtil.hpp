#pragma once

#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>

#include <string>

namespace boost_util {

// Returns true if path names an existing regular file (or a symlink to one). Never throws.
bool is_regular_file(const boost::filesystem::path& path);

void write_str_to_file(const std::string& str, const boost::filesystem::path& filename);

namespace program_options {

/*
 * Constructs a boost::program_options::command_line_parser out of (ac, av), using desc for named
 * options and positional for positional ones. Returns the parsed and notified variables_map.
 *
 * Any boost::program_options::error is rethrown as a util::CleanException, since a malformed
 * command line is the user's problem, not a bug.
 */
boost::program_options::variables_map parse_args(
  const boost::program_options::options_description& desc,
  const boost::program_options::positional_options_description& positional, int ac,
  const char* const av[]);

}  // namespace program_options

}  // namespace boost_util

#include "inline/util/BoostUtil.inl"
