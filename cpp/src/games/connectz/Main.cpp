#include "games/connectz/Main.hpp"

#include "games/connectz/Constants.hpp"
#include "games/connectz/Validator.hpp"
#include "util/Asserts.hpp"
#include "util/BoostUtil.hpp"
#include "util/Exception.hpp"
#include "util/LoggingUtil.hpp"

#include <iostream>

namespace cz {

boost::program_options::options_description Main::Args::make_options_description() {
  namespace po = boost::program_options;

  po::options_description desc("Program options");
  desc.add_options()("input-file", po::value<std::vector<std::string>>(&input_files),
                     "game log to validate (also accepted as the sole positional argument)");
  return desc;
}

int Main::main(int ac, const char* const av[]) {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  const char* program_name = ac >= 1 ? av[0] : "connectz";

  Args args;
  Validator::Params validator_params;
  util::Logging::Params log_params;

  po::options_description desc("General options");
  desc.add_options()("help,h", "help");
  desc.add(args.make_options_description())
    .add(validator_params.make_options_description())
    .add(log_params.make_options_description());

  po::positional_options_description positional;
  positional.add("input-file", -1);

  try {
    po::variables_map vm = po2::parse_args(desc, positional, ac, av);
    if (vm.count("help")) {
      std::cout << "Usage: " << program_name << " <input-file> [options]" << std::endl;
      std::cout << desc << std::endl;
      return 0;
    }

    CLEAN_ASSERT(args.input_files.size() == 1, "Expected one input file, got {}",
                 args.input_files.size());
    util::Logging::init(log_params);
  } catch (const util::CleanException& e) {
    std::cout << program_name << ": Provide one input file" << std::endl;
    std::cerr << e.what() << std::endl;
    return kUsageErrorExitCode;
  }

  Validator validator(validator_params);
  return to_exit_code(validator.validate_file(args.input_files[0]));
}

}  // namespace cz
