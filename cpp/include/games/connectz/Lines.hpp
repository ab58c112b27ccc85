#pragma once

#include "games/connectz/Configuration.hpp"
#include "games/connectz/Constants.hpp"

#include <compare>

namespace cz {

/*
 * A straight run of cells across the board: length cells starting at (column, row), each one
 * (column_step, row_step) away from the previous.
 *
 * Rows are counted from the bottom of the board, so row 0 is where the first disc of a column
 * lands.
 */
struct Line {
  auto operator<=>(const Line&) const = default;

  column_t column_at(int i) const { return column + i * column_step; }
  row_t row_at(int i) const { return row + i * row_step; }

  column_t column;
  row_t row;
  column_t column_step;
  row_t row_step;
  int length;
};

/*
 * Calls f(line) for every line on which a player could line up run_length discs, in this order:
 *
 * 1. each column, bottom to top
 * 2. each row, left to right
 * 3. the maximal diagonals of length >= run_length, alternating between the ascending
 *    (left-to-right, bottom-to-top) and descending (right-to-left, bottom-to-top) families
 *
 * A diagonal starts at (start_x, start_y) with 0 <= start_x <= X-Z and 0 <= start_y <= Y-Z and
 * runs to the edge of the board. Only starts with start_x == 0 or start_y == 0 are produced; any
 * other start lies on one of those diagonals, so it would only repeat a segment of it.
 *
 * Cells at row max_height and above are left out: lines are cut off below that row, and lines
 * lying entirely above it are skipped. Passing the height of the tallest column visits only
 * cells that can hold a disc. Pass num_rows for the full board.
 *
 * Stops as soon as f returns true, and returns whether it did.
 */
template <typename F>
bool for_each_line(const Configuration& config, row_t max_height, F&& f);

}  // namespace cz

#include "inline/games/connectz/Lines.inl"
