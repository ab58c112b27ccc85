#include "games/connectz/Board.hpp"

#include "util/Asserts.hpp"

#include <algorithm>

namespace cz {

inline Board::Board(const Configuration& config)
    : num_rows_(config.num_rows()), columns_(config.num_columns()) {}

inline int Board::height(column_t col) const {
  RELEASE_ASSERT(col >= 0 && col < num_columns(), "Bad column: {}", col);
  return columns_[col].size();
}

inline seat_index_t Board::get_player_at(row_t row, column_t col) const {
  RELEASE_ASSERT(row >= 0 && row < num_rows_, "Bad row: {}", row);
  return row < height(col) ? columns_[col][row] : kNoPlayer;
}

inline void Board::drop_disc(column_t col, seat_index_t player) {
  RELEASE_ASSERT(player == kFirst || player == kSecond, "Bad player: {}", int(player));
  RELEASE_ASSERT(!is_column_full(col), "Column {} is full", col);
  columns_[col].push_back(player);
  num_discs_++;
  max_height_ = std::max(max_height_, row_t(columns_[col].size()));
}

}  // namespace cz
