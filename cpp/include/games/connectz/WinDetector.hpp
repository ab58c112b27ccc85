#pragma once

#include "games/connectz/Board.hpp"
#include "games/connectz/Configuration.hpp"
#include "games/connectz/Constants.hpp"
#include "games/connectz/Lines.hpp"

namespace cz {

/*
 * Answers "does this player have run_length discs in a row anywhere on the board?".
 *
 * Every query walks the lines afresh, cut off at the height of the tallest column. Nothing is
 * stored per line.
 */
class WinDetector {
 public:
  explicit WinDetector(const Configuration& config)
      : config_(config), run_length_(config.run_length()) {}

  bool has_winning_line(const Board& board, seat_index_t player) const;

  // Scans the line in order, counting consecutive discs of player. Empty cells and the
  // opponent's discs reset the count.
  bool has_run(const Board& board, const Line& line, seat_index_t player) const;

 private:
  const Configuration config_;
  const int run_length_;
};

}  // namespace cz
