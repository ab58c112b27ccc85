#pragma once

#include "games/connectz/Constants.hpp"
#include "games/connectz/Outcome.hpp"

#include <compare>
#include <cstdint>
#include <expected>

namespace cz {

/*
 * Board dimensions and winning run length of a Connect-Z game: num_columns (X) columns, each
 * num_rows (Y) discs tall, won by run_length (Z) discs in a row.
 *
 * Instances can only be obtained through create(), so every Configuration satisfies
 * min(X, Y, Z) >= 1 and Z <= max(X, Y).
 */
class Configuration {
 public:
  static std::expected<Configuration, Failure> create(int num_columns, int num_rows,
                                                      int run_length);

  column_t num_columns() const { return num_columns_; }
  row_t num_rows() const { return num_rows_; }
  int run_length() const { return run_length_; }
  int64_t num_cells() const { return int64_t(num_columns_) * num_rows_; }

  auto operator<=>(const Configuration&) const = default;

 private:
  Configuration(column_t num_columns, row_t num_rows, int run_length)
      : num_columns_(num_columns), num_rows_(num_rows), run_length_(run_length) {}

  column_t num_columns_;
  row_t num_rows_;
  int run_length_;
};

}  // namespace cz
