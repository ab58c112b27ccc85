#pragma once

#include <cstdint>

namespace cz {

using column_t = int32_t;
using row_t = int32_t;
using seat_index_t = int8_t;

// A raw move as written in the log: a 1-based column index, not yet range-checked.
using move_t = int64_t;

const seat_index_t kFirst = 0;
const seat_index_t kSecond = 1;
const seat_index_t kNoPlayer = -1;

/*
 * Values double as process exit codes.
 */
enum GameResult : int8_t { kDraw = 0, kFirstWon = 1, kSecondWon = 2 };

/*
 * Listed in the order the process exit codes are assigned. Values double as those exit codes.
 *
 * Detection order is different: file, parse, configuration, then per-move (too-many-moves,
 * invalid column, overflow), then missing result.
 */
enum FailureKind : int8_t {
  kMissingResult = 3,
  kTooManyMoves = 4,
  kColumnOverflow = 5,
  kInvalidColumn = 6,
  kInvalidConfiguration = 7,
  kParsingProblem = 8,
  kFileNotFound = 9
};

constexpr int kUsageErrorExitCode = 10;

// The player who places the move at move_index (0-based).
constexpr seat_index_t player_at(int64_t move_index) { return move_index % 2 == 0 ? kFirst : kSecond; }

constexpr seat_index_t opponent(seat_index_t player) { return player == kFirst ? kSecond : kFirst; }

constexpr GameResult win_for(seat_index_t player) {
  return player == kFirst ? kFirstWon : kSecondWon;
}

}  // namespace cz
