#include "util/BoostUtil.hpp"

#include "util/Exception.hpp"

#include <fstream>

namespace boost_util {

namespace program_options {

inline boost::program_options::variables_map parse_args(
  const boost::program_options::options_description& desc,
  const boost::program_options::positional_options_description& positional, int ac,
  const char* const av[]) {
  namespace po = boost::program_options;
  po::variables_map vm;
  try {
    po::store(po::command_line_parser(ac, av).options(desc).positional(positional).run(), vm);
    po::notify(vm);
  } catch (const po::error& e) {
    throw util::CleanException("{}", e.what());
  }
  return vm;
}

}  // namespace program_options

inline bool is_regular_file(const boost::filesystem::path& path) {
  boost::system::error_code ec;
  bool regular = boost::filesystem::is_regular_file(path, ec);
  return regular && !ec;
}

inline void write_str_to_file(const std::string& str, const boost::filesystem::path& filename) {
  std::ofstream file(filename.string());
  if (file.is_open()) {
    file << str;
    file.close();
  } else {
    throw util::Exception("Unable to open file: {}", filename.string());
  }
}

}  // namespace boost_util
