#pragma once

#include "games/connectz/Configuration.hpp"
#include "games/connectz/Constants.hpp"

#include <cstdint>
#include <vector>

namespace cz {

/*
 * The grid of a Connect-Z game, stored column by column. Each column holds the discs dropped into
 * it, bottom first. Discs are only ever added.
 */
class Board {
 public:
  explicit Board(const Configuration& config);

  column_t num_columns() const { return column_t(columns_.size()); }
  row_t num_rows() const { return num_rows_; }
  int64_t num_discs() const { return num_discs_; }

  int height(column_t col) const;

  // Height of the tallest column. No disc sits at or above this row.
  row_t max_height() const { return max_height_; }
  bool is_column_full(column_t col) const { return height(col) >= num_rows_; }
  bool is_full() const { return num_discs_ == int64_t(num_columns()) * num_rows_; }

  // Returns kNoPlayer for cells above the top disc of the column.
  seat_index_t get_player_at(row_t row, column_t col) const;

  // col is 0-based. The caller is responsible for checking that col exists and is not full.
  void drop_disc(column_t col, seat_index_t player);

 private:
  using column_vec_t = std::vector<seat_index_t>;

  row_t num_rows_;
  std::vector<column_vec_t> columns_;
  int64_t num_discs_ = 0;
  row_t max_height_ = 0;
};

}  // namespace cz

#include "inline/games/connectz/Board.inl"
