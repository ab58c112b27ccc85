#include "games/connectz/IO.hpp"

#include <fmt/format.h>

#include <iterator>
#include <string>

namespace cz {

std::string IO::player_to_str(seat_index_t player) {
  switch (player) {
    case kFirst:
      return "first player";
    case kSecond:
      return "second player";
    default:
      return fmt::format("player({})", int(player));
  }
}

std::string IO::result_to_str(GameResult result) {
  switch (result) {
    case kDraw:
      return "draw";
    case kFirstWon:
      return "first player won";
    case kSecondWon:
      return "second player won";
    default:
      return fmt::format("result({})", int(result));
  }
}

std::string IO::failure_kind_to_str(FailureKind kind) {
  switch (kind) {
    case kMissingResult:
      return "missing result";
    case kTooManyMoves:
      return "too many moves";
    case kColumnOverflow:
      return "column overflow";
    case kInvalidColumn:
      return "invalid column";
    case kInvalidConfiguration:
      return "invalid configuration";
    case kParsingProblem:
      return "parsing problem";
    case kFileNotFound:
      return "file not found";
    default:
      return fmt::format("failure({})", int(kind));
  }
}

std::string IO::outcome_to_str(const Outcome& outcome) {
  if (outcome) return result_to_str(*outcome);
  return fmt::format("{}: {}", failure_kind_to_str(outcome.error().kind),
                     outcome.error().message);
}

void IO::print_board(std::ostream& ss, const Board& board, column_t last_column) {
  fmt::memory_buffer buf;
  auto out = std::back_inserter(buf);

  if (last_column >= 0) {
    fmt::format_to(out, "{}x\n", std::string(2 * last_column + 1, ' '));
  }

  for (row_t row = board.num_rows() - 1; row >= 0; --row) {
    for (column_t col = 0; col < board.num_columns(); ++col) {
      fmt::format_to(out, "|{}", disc_char(board.get_player_at(row, col)));
    }
    fmt::format_to(out, "|\n");
  }
  for (column_t col = 0; col < board.num_columns(); ++col) {
    fmt::format_to(out, "|{}", (col + 1) % 10);
  }
  fmt::format_to(out, "|\n");

  ss << fmt::to_string(buf);
}

char IO::disc_char(seat_index_t player) {
  switch (player) {
    case kFirst:
      return 'X';
    case kSecond:
      return 'O';
    default:
      return ' ';
  }
}

}  // namespace cz
