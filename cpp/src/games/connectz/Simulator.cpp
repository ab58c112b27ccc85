#include "games/connectz/Simulator.hpp"

#include "games/connectz/IO.hpp"
#include "util/Asserts.hpp"
#include "util/LoggingUtil.hpp"

namespace cz {

Simulator::Simulator(const Configuration& config)
    : config_(config), board_(config), win_detector_(config) {}

Outcome Simulator::play(const std::vector<move_t>& moves) {
  RELEASE_ASSERT(status_ == kInitialized, "play() called on a used Simulator (status={})",
                 int(status_));

  for (move_t move : moves) {
    auto applied = apply(move);
    if (!applied) return std::unexpected(applied.error());
  }
  return finish();
}

std::expected<void, Failure> Simulator::apply(move_t move) {
  RELEASE_ASSERT(status_ != kFailed, "apply() called after a failure");
  RELEASE_ASSERT(!outcome_.has_value(), "apply() called after finish()");

  seat_index_t player = current_player();

  // The previous mover's win was detected right after their move, on this same board.
  if (status_ == kConcluded) {
    return record_failure(fail(kTooManyMoves,
                               "There are more moves after end of the game (move {})",
                               num_moves_played_ + 1));
  }

  if (move < 1 || move > config_.num_columns()) {
    return record_failure(fail(kInvalidColumn, "Invalid column {}", move));
  }

  column_t col = move - 1;
  if (board_.is_column_full(col)) {
    return record_failure(fail(kColumnOverflow, "Column {} is too high", move));
  }

  board_.drop_disc(col, player);
  num_moves_played_++;
  last_column_ = col;
  status_ = kInProgress;

  LOG_DEBUG("Move {}: {} -> column {}", num_moves_played_, IO::player_to_str(player), move);

  if (has_winning_line(player)) {
    winner_ = player;
    status_ = kConcluded;
    LOG_DEBUG("{} has {} in a row", IO::player_to_str(player), config_.run_length());
  }
  return {};
}

Outcome Simulator::finish() {
  if (outcome_.has_value()) return *outcome_;

  if (winner_ != kNoPlayer) {
    outcome_ = win_for(winner_);
  } else if (board_.is_full()) {
    outcome_ = kDraw;
  } else {
    return record_failure(
      fail(kMissingResult, "There is no result after all {} moves were done", num_moves_played_));
  }

  status_ = kConcluded;
  return *outcome_;
}

seat_index_t Simulator::last_player() const {
  if (num_moves_played_ == 0) return kNoPlayer;
  return player_at(num_moves_played_ - 1);
}

std::unexpected<Failure> Simulator::record_failure(std::unexpected<Failure> failure) {
  LOG_DEBUG("Game failed: {}", failure.error().message);
  status_ = kFailed;
  outcome_ = failure;
  return failure;
}

}  // namespace cz
