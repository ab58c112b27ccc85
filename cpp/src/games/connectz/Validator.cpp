#include "games/connectz/Validator.hpp"

#include "games/connectz/IO.hpp"
#include "games/connectz/InputParser.hpp"
#include "games/connectz/Simulator.hpp"
#include "util/BoostUtil.hpp"
#include "util/LoggingUtil.hpp"

#include <fstream>
#include <iostream>

namespace cz {

boost::program_options::options_description Validator::Params::make_options_description() {
  namespace po = boost::program_options;

  po::options_description desc("Validator options");
  desc.add_options()("show-board", po::bool_switch(&show_board),
                     "print the board to stderr once the game log has been replayed");
  return desc;
}

Outcome Validator::validate(AbstractLineReader& reader) const {
  InputParser parser(reader);
  auto record = parser.parse();
  if (!record) {
    LOG_INFO("Rejected game log: {}", record.error().message);
    return std::unexpected(record.error());
  }

  const Configuration& config = record->config;
  LOG_INFO("Replaying {} moves on a {}x{} board, {} in a row to win", record->moves.size(),
           config.num_columns(), config.num_rows(), config.run_length());

  Simulator simulator(config);
  Outcome outcome = simulator.play(record->moves);
  LOG_INFO("Outcome after {} moves: {}", simulator.num_moves_played(),
           IO::outcome_to_str(outcome));

  if (params_.show_board) {
    IO::print_board(std::cerr, simulator.board(), simulator.last_column());
  }
  return outcome;
}

Outcome Validator::validate_file(const boost::filesystem::path& path) const {
  LOG_INFO("Validating {}", path.string());

  if (!boost_util::is_regular_file(path)) {
    return fail(kFileNotFound, "No such file: {}", path.string());
  }

  std::ifstream in(path.string());
  if (!in.is_open()) {
    return fail(kFileNotFound, "Unable to open file: {}", path.string());
  }

  StreamLineReader reader(in);
  return validate(reader);
}

}  // namespace cz
