#include "games/connectz/Configuration.hpp"

#include <algorithm>

namespace cz {

std::expected<Configuration, Failure> Configuration::create(int num_columns, int num_rows,
                                                            int run_length) {
  if (run_length > std::max(num_columns, num_rows) ||
      std::min({num_columns, num_rows, run_length}) < 1) {
    return fail(kInvalidConfiguration, "Illegal game x={} y={} z={}", num_columns, num_rows,
                run_length);
  }
  return Configuration(num_columns, num_rows, run_length);
}

}  // namespace cz
