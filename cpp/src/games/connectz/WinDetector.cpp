#include "games/connectz/WinDetector.hpp"

namespace cz {

bool WinDetector::has_winning_line(const Board& board, seat_index_t player) const {
  return for_each_line(config_, board.max_height(),
                       [&](const Line& line) { return has_run(board, line, player); });
}

bool WinDetector::has_run(const Board& board, const Line& line, seat_index_t player) const {
  int repeats = 0;
  for (int i = 0; i < line.length; ++i) {
    if (board.get_player_at(line.row_at(i), line.column_at(i)) == player) {
      if (++repeats == run_length_) return true;
    } else {
      repeats = 0;
    }
  }
  return false;
}

}  // namespace cz
