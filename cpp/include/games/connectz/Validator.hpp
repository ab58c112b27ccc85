#pragma once

#include "games/connectz/LineReader.hpp"
#include "games/connectz/Outcome.hpp"

#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>

namespace cz {

/*
 * Drives InputParser and Simulator over one game log and reports its outcome.
 */
class Validator {
 public:
  struct Params {
    bool show_board = false;

    boost::program_options::options_description make_options_description();
  };

  explicit Validator(const Params& params) : params_(params) {}
  Validator() : Validator(Params{}) {}

  Outcome validate(AbstractLineReader& reader) const;

  // Fails with kFileNotFound if path is not a readable regular file.
  Outcome validate_file(const boost::filesystem::path& path) const;

 private:
  const Params params_;
};

}  // namespace cz
