#pragma once

#include "games/connectz/Board.hpp"
#include "games/connectz/Constants.hpp"
#include "games/connectz/Outcome.hpp"

#include <ostream>
#include <string>

namespace cz {

struct IO {
  static std::string player_to_str(seat_index_t player);
  static std::string result_to_str(GameResult result);
  static std::string failure_kind_to_str(FailureKind kind);
  static std::string outcome_to_str(const Outcome& outcome);

  /*
   * Prints the board top row first, with a column-number footer. Discs of the first player are
   * drawn as X, those of the second player as O. If last_column (0-based) is given, an 'x' above
   * the board marks it.
   *
   * |O| | |
   * |X|O| |
   * |X|X|O|
   * |1|2|3|
   *
   * Column numbers above 9 are printed modulo 10 to keep cells one character wide.
   */
  static void print_board(std::ostream&, const Board&, column_t last_column = -1);

 private:
  static char disc_char(seat_index_t player);
};

}  // namespace cz
