#pragma once

#include <boost/program_options.hpp>

#include <string>
#include <vector>

namespace cz {

/*
 * The connectz executable:
 *
 * connectz <input-file> [options]
 *
 * Validates the game log in input-file and exits with to_exit_code() of its outcome. Anything
 * other than exactly one input file prints a usage line to stdout and exits with
 * kUsageErrorExitCode.
 */
struct Main {
  struct Args {
    std::vector<std::string> input_files;

    boost::program_options::options_description make_options_description();
  };

  static int main(int ac, const char* const av[]);
};

}  // namespace cz
