#include "games/connectz/Outcome.hpp"

namespace cz {

int to_exit_code(const Outcome& outcome) {
  if (outcome) return int(*outcome);
  return int(outcome.error().kind);
}

}  // namespace cz
