#include "games/connectz/InputParser.hpp"

#include "util/LoggingUtil.hpp"
#include "util/StringUtil.hpp"

#include <boost/lexical_cast.hpp>

#include <utility>

namespace cz {

template <typename T>
std::optional<T> InputParser::parse_int(const std::string& token) {
  T value{};
  if (!boost::conversion::try_lexical_convert(token, value)) return std::nullopt;
  return value;
}

std::expected<GameRecord, Failure> InputParser::parse() {
  std::string line;
  std::vector<std::string> tokens;

  if (!reader_.read_line(line)) {
    return fail(kParsingProblem, "Empty input");
  }

  int num_tokens = util::split(tokens, line);
  if (num_tokens != 3) {
    return fail(kParsingProblem, "Expected 3 parameters on line 1, got {}: \"{}\"", num_tokens,
                line);
  }

  int params[3];
  for (int i = 0; i < 3; ++i) {
    std::optional<int> param = parse_int<int>(tokens[i]);
    if (!param) {
      return fail(kParsingProblem, "Invalid parameter \"{}\" on line 1", tokens[i]);
    }
    params[i] = *param;
  }

  std::vector<move_t> moves;
  int line_number = 1;
  int blank_line_number = 0;  // first blank line not yet known to be trailing
  while (reader_.read_line(line)) {
    ++line_number;
    num_tokens = util::split(tokens, line);
    if (num_tokens == 0) {
      if (!blank_line_number) blank_line_number = line_number;
      continue;
    }
    if (blank_line_number) {
      return fail(kParsingProblem, "Blank line {} is followed by more moves", blank_line_number);
    }
    if (num_tokens != 1) {
      return fail(kParsingProblem, "Expected one column on line {}, got {}: \"{}\"", line_number,
                  num_tokens, line);
    }
    std::optional<move_t> move = parse_int<move_t>(tokens[0]);
    if (!move) {
      return fail(kParsingProblem, "Invalid column \"{}\" on line {}", tokens[0], line_number);
    }
    moves.push_back(*move);
  }

  LOG_DEBUG("Parsed x={} y={} z={} and {} moves", params[0], params[1], params[2], moves.size());

  auto config = Configuration::create(params[0], params[1], params[2]);
  if (!config) return std::unexpected(config.error());

  return GameRecord{*config, std::move(moves)};
}

}  // namespace cz
