#include "games/connectz/Lines.hpp"

#include <algorithm>

namespace cz {

template <typename F>
bool for_each_line(const Configuration& config, row_t max_height, F&& f) {
  column_t X = config.num_columns();
  row_t Y = config.num_rows();
  int Z = config.run_length();
  row_t top = std::min(max_height, Y);

  if (top <= 0) return false;

  for (column_t col = 0; col < X; ++col) {
    if (f(Line{col, 0, 0, 1, top})) return true;
  }

  for (row_t row = 0; row < top; ++row) {
    if (f(Line{0, row, 1, 0, X})) return true;
  }

  // No diagonal fits when Z exceeds one of the dimensions
  if (Z > X || Z > Y) return false;

  auto diagonals = [&](column_t start_x, row_t start_y) {
    int length = std::min({X - start_x, Y - start_y, top - start_y});
    if (f(Line{start_x, start_y, 1, 1, length})) return true;
    return bool(f(Line{X - 1 - start_x, start_y, -1, 1, length}));
  };

  for (row_t start_y = 0; start_y <= Y - Z && start_y < top; ++start_y) {
    if (diagonals(0, start_y)) return true;
  }
  for (column_t start_x = 1; start_x <= X - Z; ++start_x) {
    if (diagonals(start_x, 0)) return true;
  }
  return false;
}

}  // namespace cz
