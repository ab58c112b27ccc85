#pragma once

#include "games/connectz/Board.hpp"
#include "games/connectz/Configuration.hpp"
#include "games/connectz/Constants.hpp"
#include "games/connectz/Outcome.hpp"
#include "games/connectz/WinDetector.hpp"

#include <cstdint>
#include <expected>
#include <optional>
#include <vector>

namespace cz {

/*
 * Replays a Connect-Z move log on an initially empty board and classifies the game.
 *
 * Usage:
 *
 * Simulator simulator(config);
 * Outcome outcome = simulator.play(moves);
 *
 * or, move by move:
 *
 * for (move_t move : moves) {
 *   auto applied = simulator.apply(move);
 *   if (!applied) ...
 * }
 * Outcome outcome = simulator.finish();
 *
 * A Simulator validates exactly one game. Once it has failed, or once finish() has produced an
 * outcome, calling apply() again is a bug.
 */
class Simulator {
 public:
  enum status_t : int8_t {
    kInitialized,  // no move applied yet
    kInProgress,   // moves applied, nobody has won
    kConcluded,    // the last mover has won, or finish() produced a result
    kFailed        // a failure was reported
  };

  explicit Simulator(const Configuration& config);

  Outcome play(const std::vector<move_t>& moves);

  /*
   * Applies a single move (1-based column) for the player to move. Checks, in order:
   *
   * 1. nobody has won yet (else kTooManyMoves)
   * 2. 1 <= move <= num_columns (else kInvalidColumn)
   * 3. the column is not full (else kColumnOverflow)
   */
  std::expected<void, Failure> apply(move_t move);

  /*
   * Classifies the game after the last move: a win for the last mover, else a draw if the board
   * is full, else kMissingResult. Repeated calls return the same outcome.
   */
  Outcome finish();

  const Configuration& config() const { return config_; }
  const Board& board() const { return board_; }
  const WinDetector& win_detector() const { return win_detector_; }
  status_t status() const { return status_; }
  int64_t num_moves_played() const { return num_moves_played_; }
  seat_index_t current_player() const { return player_at(num_moves_played_); }

  // Returns kNoPlayer if no move has been played yet.
  seat_index_t last_player() const;

  // 0-based column of the last disc dropped, or -1 if no disc has been dropped.
  column_t last_column() const { return last_column_; }

  // Returns kNoPlayer if nobody has won.
  seat_index_t winner() const { return winner_; }

  bool has_winning_line(seat_index_t player) const {
    return win_detector_.has_winning_line(board_, player);
  }

 private:
  std::unexpected<Failure> record_failure(std::unexpected<Failure> failure);

  const Configuration config_;
  Board board_;
  const WinDetector win_detector_;
  status_t status_ = kInitialized;
  int64_t num_moves_played_ = 0;
  column_t last_column_ = -1;
  seat_index_t winner_ = kNoPlayer;
  std::optional<Outcome> outcome_;
};

}  // namespace cz
