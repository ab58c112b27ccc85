#pragma once

#include "games/connectz/Configuration.hpp"
#include "games/connectz/Constants.hpp"
#include "games/connectz/LineReader.hpp"
#include "games/connectz/Outcome.hpp"

#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace cz {

// A parsed game log: the game's configuration and its moves (1-based columns), in order.
struct GameRecord {
  Configuration config;
  std::vector<move_t> moves;
};

/*
 * Parses a game log:
 *
 * X Y Z
 * <column>
 * <column>
 * ...
 *
 * The first line holds exactly three integers, every following line exactly one. Blank lines are
 * tolerated only at the end of the input.
 *
 * All lines are parsed before the configuration is validated, so a kParsingProblem anywhere in
 * the input takes precedence over a kInvalidConfiguration.
 */
class InputParser {
 public:
  explicit InputParser(AbstractLineReader& reader) : reader_(reader) {}

  std::expected<GameRecord, Failure> parse();

 private:
  // Signed decimal integer with an optional '+'. Returns std::nullopt on anything else, including
  // values out of range for T.
  template <typename T>
  static std::optional<T> parse_int(const std::string& token);

  AbstractLineReader& reader_;
};

}  // namespace cz
